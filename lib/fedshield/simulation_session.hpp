#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#include <glog/logging.h>
#include <boost/format.hpp>

#include "vector_math.hpp"
#include "simulation_config.hpp"
#include "round_state.hpp"
#include "client_generator.hpp"
#include "importance_estimator.hpp"
#include "detection_pipeline.hpp"
#include "aggregator.hpp"

namespace fedshield
{
	/** one independent simulation: owns the seeded random source and the true gradient direction
	 *  the true direction is drawn once at construction and survives reset()
	 *  advance() is not idempotent: every call consumes the session's random stream, so advancing the same
	 *  state twice gives two different rounds, and the rounds after reset() are not a replay of the first run
	 *  a session is not synchronized, a host sharing it between threads must serialize advance()
	 */
	template<typename model_datatype>
	class simulation_session
	{
	public:
		explicit simulation_session(const simulation_config& config, const std::vector<std::string>& mechanism_order = detection_pipeline<model_datatype>::default_mechanism_order())
			: _vector_dimension(validated(config).vector_dimension), _seed(config.seed), _source(config.seed), _pipeline(mechanism_order)
		{
			_true_direction = vector_math::standard_normal_vector<model_datatype>(_source, _vector_dimension);
		}

		round_state<model_datatype> initialize(const simulation_config& config) const
		{
			check_session_config(config);
			round_state<model_datatype> output;
			output.round = 0;
			output.global_accuracy = round_state<model_datatype>::initial_accuracy;
			output.backdoor_success_rate = round_state<model_datatype>::initial_attack_success_rate;
			output.importance = importance_estimator<model_datatype>::initial_importance(_vector_dimension);
			return output;
		}

		/// discards history and importance accumulation, the true direction and the random stream continue
		round_state<model_datatype> reset(const simulation_config& config) const
		{
			return initialize(config);
		}

		/// generate -> importance update -> detection -> aggregation, throws before producing anything on an invalid config
		/// the result depends on previous, config and the position in the random stream
		round_state<model_datatype> advance(const round_state<model_datatype>& previous, const simulation_config& config)
		{
			check_session_config(config);
			if (previous.importance.size() != _vector_dimension)
				throw std::invalid_argument((boost::format("previous state has importance dimension %1%, session dimension is %2%") % previous.importance.size() % _vector_dimension).str());

			round_state<model_datatype> next;
			next.round = previous.round + 1;

			client_generator<model_datatype> generator(_true_direction, _source);
			next.clients = generator.generate(config);

			next.importance = importance_estimator<model_datatype>::update(previous.importance, config.momentum_fim_enabled);

			const detection_context<model_datatype> context{next.importance, _true_direction, config};
			_pipeline.process(next.clients, context, config.detection_worker_threads);

			aggregator<model_datatype>::update_metrics(previous, next);

			LOG_IF(WARNING, aggregator<model_datatype>::count_acceptance(next.clients).accepted_count == 0) << "round " << next.round << ": every client update is rejected";
			return next;
		}

		const vector_type<model_datatype>& true_direction() const
		{
			return _true_direction;
		}

		size_t vector_dimension() const
		{
			return _vector_dimension;
		}

		uint32_t seed() const
		{
			return _seed;
		}

		const detection_pipeline<model_datatype>& pipeline() const
		{
			return _pipeline;
		}

	private:
		static const simulation_config& validated(const simulation_config& config)
		{
			auto [status, message] = config.validate();
			if (status != config_status::success) throw std::invalid_argument("invalid simulation configuration: " + message);
			return config;
		}

		void check_session_config(const simulation_config& config) const
		{
			validated(config);
			if (config.vector_dimension != _vector_dimension)
				throw std::invalid_argument((boost::format("vector_dimension cannot change within a session (%1% -> %2%)") % _vector_dimension % config.vector_dimension).str());
			if (config.seed != _seed)
				throw std::invalid_argument((boost::format("seed cannot change within a session (%1% -> %2%)") % _seed % config.seed).str());
		}

		size_t _vector_dimension;
		uint32_t _seed;
		random_source _source;
		vector_type<model_datatype> _true_direction;
		detection_pipeline<model_datatype> _pipeline;
	};
}
