#pragma once

#include <deque>
#include <vector>
#include <algorithm>

#include "client.hpp"
#include "round_state.hpp"

namespace fedshield
{
	template<typename model_datatype>
	struct acceptance_statistics
	{
		size_t accepted_count = 0;
		size_t malicious_accepted = 0;

		/// fraction of accepted updates that are malicious, 0 when nothing is accepted
		model_datatype attack_impact() const
		{
			return static_cast<model_datatype>(malicious_accepted) / static_cast<model_datatype>(std::max<size_t>(accepted_count, 1));
		}
	};

	template<typename model_datatype>
	class aggregator
	{
	public:
		static constexpr model_datatype smoothing = 0.8;
		static constexpr model_datatype target_weight = 0.2;
		static constexpr model_datatype max_accuracy = 0.95;
		static constexpr model_datatype accuracy_penalty = 0.5;
		static constexpr model_datatype contamination_threshold = 0.1;
		static constexpr model_datatype attack_success_target = 0.9;

		static acceptance_statistics<model_datatype> count_acceptance(const std::vector<client<model_datatype>>& clients)
		{
			acceptance_statistics<model_datatype> output;
			for (const auto& single_client : clients)
			{
				if (!single_client.accepted) continue;
				output.accepted_count++;
				if (single_client.type == client_type::malicious) output.malicious_accepted++;
			}
			return output;
		}

		static model_datatype next_accuracy(model_datatype previous, model_datatype attack_impact)
		{
			const model_datatype target = max_accuracy - attack_impact * accuracy_penalty;
			return previous * smoothing + target * target_weight;
		}

		/// the target is a step on contamination, the smoothing keeps the trajectory continuous
		static model_datatype next_attack_success_rate(model_datatype previous, model_datatype attack_impact)
		{
			const model_datatype target = attack_impact > contamination_threshold ? attack_success_target : 0;
			return previous * smoothing + target * target_weight;
		}

		static void append_history(std::deque<history_entry<model_datatype>>& history, const history_entry<model_datatype>& entry)
		{
			history.push_back(entry);
			while (history.size() > round_state<model_datatype>::history_capacity)
			{
				history.pop_front();
			}
		}

		/// writes accuracy, ASR and history of next from previous and next.clients
		static void update_metrics(const round_state<model_datatype>& previous, round_state<model_datatype>& next)
		{
			const auto statistics = count_acceptance(next.clients);
			const model_datatype impact = statistics.attack_impact();
			next.global_accuracy = next_accuracy(previous.global_accuracy, impact);
			next.backdoor_success_rate = next_attack_success_rate(previous.backdoor_success_rate, impact);
			next.history = previous.history;
			append_history(next.history, {next.round, next.global_accuracy, next.backdoor_success_rate});
		}
	};
}
