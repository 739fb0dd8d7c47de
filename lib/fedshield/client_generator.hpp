#pragma once

#include <cmath>
#include <vector>
#include <numbers>

#include "client.hpp"
#include "vector_math.hpp"
#include "simulation_config.hpp"

namespace fedshield
{
	/** synthetic gradients around the true direction
	 *  benign:    true + noise * L * 2 + sin(distribution * 2pi + j) * L
	 *  malicious: same, then trigger coordinates (j < 5) are pulled by -strength * 5
	 *             and the others get extra N(0, 0.5) noise to blend in
	 *  the draw order (client by client, coordinate by coordinate) is part of the reproducibility contract
	 */
	template<typename model_datatype>
	class client_generator
	{
	public:
		static constexpr model_datatype malicious_data_distribution = 0.9; //colluding attackers share similar data
		static constexpr model_datatype trigger_pull_factor = 5.0;
		static constexpr model_datatype stealth_noise_scale = 0.5;

		client_generator(const vector_type<model_datatype>& true_direction, random_source& source) : _true_direction(true_direction), _source(source)
		{
		}

		std::vector<client<model_datatype>> generate(const simulation_config& config)
		{
			std::vector<client<model_datatype>> output;
			output.reserve(config.client_count);
			const size_t malicious_count = config.malicious_client_count();
			for (size_t i = 0; i < config.client_count; ++i)
			{
				const client_type type = i < malicious_count ? client_type::malicious : client_type::benign;
				output.push_back(generate_client(i, type, config));
			}
			return output;
		}

		client<model_datatype> generate_client(size_t index, client_type type, const simulation_config& config)
		{
			client<model_datatype> output;
			output.id = index;
			output.type = type;
			output.data_distribution = type == client_type::malicious ? malicious_data_distribution : static_cast<model_datatype>(index) / static_cast<model_datatype>(config.client_count);
			output.gradient = generate_gradient(type, output.data_distribution, static_cast<model_datatype>(config.non_iid_level), static_cast<model_datatype>(config.attack_strength()));
			output.accepted = true;
			output.stiffness_score = 0;
			return output;
		}

	private:
		vector_type<model_datatype> generate_gradient(client_type type, model_datatype distribution, model_datatype non_iid_level, model_datatype attack_strength)
		{
			vector_type<model_datatype> gradient(_true_direction.size());
			for (size_t j = 0; j < _true_direction.size(); ++j)
			{
				model_datatype value = _true_direction[j];

				const model_datatype noise = vector_math::standard_normal<model_datatype>(_source) * non_iid_level * 2;
				const model_datatype bias = std::sin(distribution * std::numbers::pi_v<model_datatype> * 2 + static_cast<model_datatype>(j)) * non_iid_level;
				value += noise + bias;

				if (type == client_type::malicious)
				{
					if (is_high_importance(j))
					{
						value -= attack_strength * trigger_pull_factor;
					}
					else
					{
						value += vector_math::standard_normal<model_datatype>(_source) * stealth_noise_scale;
					}
				}

				gradient[j] = value;
			}
			return gradient;
		}

		const vector_type<model_datatype>& _true_direction;
		random_source& _source;
	};
}
