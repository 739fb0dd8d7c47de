#pragma once

#include <string>
#include <vector>
#include <sstream>

#include "client.hpp"
#include "round_state.hpp"
#include "simulation_config.hpp"
#include "simulation_session.hpp"

namespace fedshield
{
    template<typename model_datatype>
    struct defense_trial_result
    {
        bool stiffness_mask_enabled = false;
        bool layer_weighted_clustering_enabled = false;
        size_t malicious_seen = 0;
        size_t malicious_accepted = 0;
        size_t benign_seen = 0;
        size_t benign_accepted = 0;
        model_datatype final_accuracy = 0;
        model_datatype final_attack_success_rate = 0;

        model_datatype malicious_acceptance_rate() const
        {
            return malicious_seen == 0 ? 0 : static_cast<model_datatype>(malicious_accepted) / static_cast<model_datatype>(malicious_seen);
        }

        model_datatype benign_acceptance_rate() const
        {
            return benign_seen == 0 ? 0 : static_cast<model_datatype>(benign_accepted) / static_cast<model_datatype>(benign_seen);
        }

        std::string get_name() const
        {
            std::ostringstream ss;
            ss << "stiffness:" << (stiffness_mask_enabled ? "on" : "off") << ",clustering:" << (layer_weighted_clustering_enabled ? "on" : "off");
            return ss.str();
        }
    };

    /** runs one fresh session for `rounds` rounds and counts acceptances from round `first_counted_round` on
     *  detection consumes no randomness, so trials with the same seed see identical gradients whatever the toggles
     */
    template<typename model_datatype>
    defense_trial_result<model_datatype> run_defense_trial(const simulation_config& config, int rounds, int first_counted_round = 1)
    {
        defense_trial_result<model_datatype> output;
        output.stiffness_mask_enabled = config.stiffness_mask_enabled;
        output.layer_weighted_clustering_enabled = config.layer_weighted_clustering_enabled;

        simulation_session<model_datatype> session(config);
        round_state<model_datatype> state = session.initialize(config);
        for (int round = 1; round <= rounds; ++round)
        {
            state = session.advance(state, config);
            if (state.round < first_counted_round) continue;
            for (const auto& single_client : state.clients)
            {
                if (single_client.type == client_type::malicious)
                {
                    output.malicious_seen++;
                    if (single_client.accepted) output.malicious_accepted++;
                }
                else
                {
                    output.benign_seen++;
                    if (single_client.accepted) output.benign_accepted++;
                }
            }
        }
        output.final_accuracy = state.global_accuracy;
        output.final_attack_success_rate = state.backdoor_success_rate;
        return output;
    }

    /// the four stiffness/clustering combinations, every other setting taken from base_config
    template<typename model_datatype>
    std::vector<defense_trial_result<model_datatype>> compare_defenses(const simulation_config& base_config, int rounds, int first_counted_round = 1)
    {
        std::vector<defense_trial_result<model_datatype>> output;
        for (bool stiffness : {false, true})
        {
            for (bool clustering : {false, true})
            {
                simulation_config config = base_config;
                config.stiffness_mask_enabled = stiffness;
                config.layer_weighted_clustering_enabled = clustering;
                output.push_back(run_defense_trial<model_datatype>(config, rounds, first_counted_round));
            }
        }
        return output;
    }
}
