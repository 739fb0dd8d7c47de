#pragma once

#include <cmath>
#include <tuple>
#include <string>
#include <cstdint>
#include <limits>

#include <boost/format.hpp>

#include "vector_math.hpp"
#include "configure_file.hpp"

namespace fedshield
{
	enum class config_status
	{
		success,
		out_of_range,
		not_finite,
		missing_item,
	};

	/// engine inputs, read before every round and allowed to change between rounds except seed and vector_dimension
	struct simulation_config
	{
		//defense toggles
		bool momentum_fim_enabled = true;
		bool stiffness_mask_enabled = true;
		bool layer_weighted_clustering_enabled = true;

		//environment
		double non_iid_level = 0.5;  //[0,2]
		double attack_stealth = 0.6; //[0,0.9]
		size_t client_count = 20;
		double malicious_ratio = 0.2; //[0,1]

		//fixed for the lifetime of a session
		size_t vector_dimension = 20;
		uint32_t seed = 42;

		//scoring threads, 1 = sequential
		size_t detection_worker_threads = 1;

		static constexpr double non_iid_level_max = 2.0;
		static constexpr double attack_stealth_max = 0.9;
		static constexpr double base_attack_strength = 1.5;
		static constexpr double malicious_count_epsilon = 1e-9; //N * r of a decimal ratio can land just below an integer

		double attack_strength() const
		{
			return base_attack_strength - attack_stealth;
		}

		size_t malicious_client_count() const
		{
			return static_cast<size_t>(std::floor(static_cast<double>(client_count) * malicious_ratio + malicious_count_epsilon));
		}

		std::tuple<config_status, std::string> validate() const
		{
			const auto check_range = [](const char* name, double value, double min, double max) -> std::tuple<config_status, std::string> {
				if (!std::isfinite(value)) return {config_status::not_finite, (boost::format("%1% is not finite") % name).str()};
				if (value < min || value > max) return {config_status::out_of_range, (boost::format("%1% = %2% is out of range [%3%, %4%]") % name % value % min % max).str()};
				return {config_status::success, ""};
			};

			for (auto result : {check_range("non_iid_level", non_iid_level, 0.0, non_iid_level_max),
			                    check_range("attack_stealth", attack_stealth, 0.0, attack_stealth_max),
			                    check_range("malicious_ratio", malicious_ratio, 0.0, 1.0)})
			{
				if (std::get<0>(result) != config_status::success) return result;
			}

			if (client_count < 1) return {config_status::out_of_range, "client_count must be at least 1"};
			if (vector_dimension < high_importance_dimension)
				return {config_status::out_of_range, (boost::format("vector_dimension = %1% must be >= %2%, indices 0-%3% are the trigger coordinates") % vector_dimension % high_importance_dimension % (high_importance_dimension - 1)).str()};
			if (detection_worker_threads < 1) return {config_status::out_of_range, "detection_worker_threads must be at least 1"};

			return {config_status::success, ""};
		}

		configuration_file::json to_json() const
		{
			configuration_file::json output;
			output["momentum_fim_enabled"] = momentum_fim_enabled;
			output["stiffness_mask_enabled"] = stiffness_mask_enabled;
			output["layer_weighted_clustering_enabled"] = layer_weighted_clustering_enabled;
			output["non_iid_level"] = non_iid_level;
			output["attack_stealth"] = attack_stealth;
			output["client_count"] = client_count;
			output["malicious_ratio"] = malicious_ratio;
			output["vector_dimension"] = vector_dimension;
			output["seed"] = seed;
			output["detection_worker_threads"] = detection_worker_threads;
			return output;
		}

		/// read the engine items, a missing or mistyped item is reported instead of being replaced by the default
		static std::tuple<config_status, std::string> from_configuration(const configuration_file& config, simulation_config& output)
		{
			simulation_config temp;
			const auto read_item = [&config]<typename T>(const std::string& name, T& target) -> bool {
				auto value = config.get<T>(name);
				if (!value) return false;
				target = *value;
				return true;
			};

			//json converts 20.7 to 20 and -1 to 4294967295 without complaint, integer items are checked first
			const auto& json_data = config.get_json();
			for (const char* name : {"client_count", "vector_dimension", "detection_worker_threads", "seed"})
			{
				auto iter = json_data.find(name);
				if (iter == json_data.end() || !iter->is_number_integer())
					return {config_status::missing_item, (boost::format("%1% is missing or not an integer") % name).str()};
			}

			bool all_found = true;
			all_found &= read_item("momentum_fim_enabled", temp.momentum_fim_enabled);
			all_found &= read_item("stiffness_mask_enabled", temp.stiffness_mask_enabled);
			all_found &= read_item("layer_weighted_clustering_enabled", temp.layer_weighted_clustering_enabled);
			all_found &= read_item("non_iid_level", temp.non_iid_level);
			all_found &= read_item("attack_stealth", temp.attack_stealth);
			all_found &= read_item("malicious_ratio", temp.malicious_ratio);

			//integers are read signed so that a negative value is reported as out of range
			int64_t client_count = 0, vector_dimension = 0, detection_worker_threads = 0, seed = 0;
			all_found &= read_item("client_count", client_count);
			all_found &= read_item("vector_dimension", vector_dimension);
			all_found &= read_item("detection_worker_threads", detection_worker_threads);
			all_found &= read_item("seed", seed);
			if (!all_found) return {config_status::missing_item, "configuration item missing or has a wrong type"};

			if (seed < 0 || seed > static_cast<int64_t>(std::numeric_limits<uint32_t>::max()))
				return {config_status::out_of_range, (boost::format("seed = %1% is out of range [0, %2%]") % seed % std::numeric_limits<uint32_t>::max()).str()};
			temp.seed = static_cast<uint32_t>(seed);
			if (client_count < 1) return {config_status::out_of_range, "client_count must be at least 1"};
			if (vector_dimension < 0) return {config_status::out_of_range, "vector_dimension must not be negative"};
			if (detection_worker_threads < 1) return {config_status::out_of_range, "detection_worker_threads must be at least 1"};
			temp.client_count = static_cast<size_t>(client_count);
			temp.vector_dimension = static_cast<size_t>(vector_dimension);
			temp.detection_worker_threads = static_cast<size_t>(detection_worker_threads);

			auto result = temp.validate();
			if (std::get<0>(result) != config_status::success) return result;
			output = temp;
			return {config_status::success, ""};
		}
	};
}
