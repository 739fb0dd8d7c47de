#pragma once

#include <map>
#include <mutex>
#include <cmath>
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include "client.hpp"
#include "vector_math.hpp"
#include "simulation_config.hpp"

namespace fedshield
{
	template<typename model_datatype>
	struct detection_context
	{
		const vector_type<model_datatype>& importance;
		const vector_type<model_datatype>& true_direction;
		const simulation_config& config;
	};

	template<typename model_datatype>
	struct detection_result
	{
		bool rejected = false;
		model_datatype score = 0;
	};

	template <typename model_datatype>
	class detection_mechanism
	{
	public:
		detection_mechanism() = default;
		virtual ~detection_mechanism() = default;

		virtual std::shared_ptr<detection_mechanism> create_shared() = 0;

		virtual std::string get_name() const = 0;

		virtual bool is_enabled(const simulation_config& config) const = 0;

		virtual detection_result<model_datatype> evaluate(const client<model_datatype>& target, const detection_context<model_datatype>& context) const = 0;

		/// store the mechanism's score on the client, mechanisms without a dedicated field keep it to themselves
		virtual void record_score(client<model_datatype>& target, model_datatype score) const
		{
		}

		static std::optional<std::shared_ptr<detection_mechanism>> create_mechanism_from_name(const std::string& name)
		{
			std::lock_guard guard(_registry_lock);
			auto iter = _all_mechanisms.find(name);
			if (iter == _all_mechanisms.end()) {
				return {};
			}
			return {iter->second->create_shared()};
		}

		static std::vector<std::string> get_registered_names()
		{
			std::lock_guard guard(_registry_lock);
			std::vector<std::string> output;
			for (const auto& [name, mechanism] : _all_mechanisms)
			{
				output.push_back(name);
			}
			return output;
		}

	private:
		static std::map<std::string, std::shared_ptr<detection_mechanism>> _all_mechanisms;
		static std::mutex _registry_lock;

	protected:
		static void _registerMechanism(std::shared_ptr<detection_mechanism> mechanism)
		{
			std::lock_guard guard(_registry_lock);
			const std::string name = mechanism->get_name();
			auto iter = _all_mechanisms.find(name);
			if (iter == _all_mechanisms.end())
			{
				_all_mechanisms.emplace(name, mechanism);
			}
		}
	};
	template<typename model_datatype> std::map<std::string, std::shared_ptr<detection_mechanism<model_datatype>>> detection_mechanism<model_datatype>::_all_mechanisms;
	template<typename model_datatype> std::mutex detection_mechanism<model_datatype>::_registry_lock;

	/// mechanism A: importance-weighted mean absolute gradient, a backdoor concentrates magnitude on the sensitive coordinates
	template <typename model_datatype>
	class stiffness_conflict : public detection_mechanism<model_datatype>
	{
	public:
		static constexpr model_datatype threshold_with_momentum_fim = 12.0;
		static constexpr model_datatype threshold_without_momentum_fim = 15.0;

		std::shared_ptr<detection_mechanism<model_datatype>> create_shared() override
		{
			return std::make_shared<stiffness_conflict>();
		}

		std::string get_name() const override
		{
			return "stiffness_conflict";
		}

		bool is_enabled(const simulation_config& config) const override
		{
			return config.stiffness_mask_enabled;
		}

		static model_datatype threshold(const simulation_config& config)
		{
			const model_datatype base = config.momentum_fim_enabled ? threshold_with_momentum_fim : threshold_without_momentum_fim;
			return base * (1 + static_cast<model_datatype>(config.non_iid_level));
		}

		static model_datatype score(const vector_type<model_datatype>& gradient, const vector_type<model_datatype>& importance)
		{
			model_datatype sum = 0;
			for (size_t j = 0; j < gradient.size(); ++j)
			{
				sum += importance[j] * std::abs(gradient[j]);
			}
			return sum / static_cast<model_datatype>(gradient.size());
		}

		detection_result<model_datatype> evaluate(const client<model_datatype>& target, const detection_context<model_datatype>& context) const override
		{
			const model_datatype stiffness = score(target.gradient, context.importance);
			return {stiffness > threshold(context.config), stiffness};
		}

		void record_score(client<model_datatype>& target, model_datatype score) const override
		{
			target.stiffness_score = score;
		}

		static void register_mechanism()
		{
			detection_mechanism<model_datatype>::_registerMechanism(std::make_shared<stiffness_conflict>());
		}
	};

	/// mechanism B: importance-weighted squared distance to the true direction, damps the noisy low-importance coordinates under non-IID data
	template <typename model_datatype>
	class importance_weighted_clustering : public detection_mechanism<model_datatype>
	{
	public:
		static constexpr model_datatype distance_threshold = 500.0;

		std::shared_ptr<detection_mechanism<model_datatype>> create_shared() override
		{
			return std::make_shared<importance_weighted_clustering>();
		}

		std::string get_name() const override
		{
			return "importance_weighted_clustering";
		}

		bool is_enabled(const simulation_config& config) const override
		{
			return config.layer_weighted_clustering_enabled;
		}

		/// the (1 + non_iid_level) scaling is applied whether or not the distance is importance weighted
		static model_datatype threshold(const simulation_config& config)
		{
			return distance_threshold * (1 + static_cast<model_datatype>(config.non_iid_level));
		}

		detection_result<model_datatype> evaluate(const client<model_datatype>& target, const detection_context<model_datatype>& context) const override
		{
			model_datatype distance = 0;
			for (size_t j = 0; j < target.gradient.size(); ++j)
			{
				const model_datatype weight = context.config.layer_weighted_clustering_enabled ? context.importance[j] : 1;
				const model_datatype diff = target.gradient[j] - context.true_direction[j];
				distance += weight * (diff * diff);
			}
			return {distance > threshold(context.config), distance};
		}

		void record_score(client<model_datatype>& target, model_datatype score) const override
		{
			target.clustering_distance = score;
		}

		static void register_mechanism()
		{
			detection_mechanism<model_datatype>::_registerMechanism(std::make_shared<importance_weighted_clustering>());
		}
	};

	/// undefended baseline, only active when neither importance-based mechanism is
	template <typename model_datatype>
	class magnitude_fallback : public detection_mechanism<model_datatype>
	{
	public:
		static constexpr model_datatype magnitude_threshold = 25.0;

		std::shared_ptr<detection_mechanism<model_datatype>> create_shared() override
		{
			return std::make_shared<magnitude_fallback>();
		}

		std::string get_name() const override
		{
			return "magnitude_fallback";
		}

		bool is_enabled(const simulation_config& config) const override
		{
			return !config.stiffness_mask_enabled && !config.layer_weighted_clustering_enabled;
		}

		detection_result<model_datatype> evaluate(const client<model_datatype>& target, const detection_context<model_datatype>& context) const override
		{
			const model_datatype magnitude = vector_math::magnitude(target.gradient);
			return {magnitude > magnitude_threshold, magnitude};
		}

		static void register_mechanism()
		{
			detection_mechanism<model_datatype>::_registerMechanism(std::make_shared<magnitude_fallback>());
		}
	};

	template <typename model_datatype>
	void register_detection_mechanisms()
	{
		stiffness_conflict<model_datatype>::register_mechanism();
		importance_weighted_clustering<model_datatype>::register_mechanism();
		magnitude_fallback<model_datatype>::register_mechanism();
	}
}
