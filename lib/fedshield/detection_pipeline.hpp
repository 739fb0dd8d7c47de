#pragma once

#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include "tmt.hpp"
#include "client.hpp"
#include "detection_mechanism.hpp"

namespace fedshield
{
	/** ordered list of detection mechanisms
	 *  every enabled mechanism is evaluated in order until one rejects, a rejected client is never accepted again
	 *  add a defense by registering a mechanism type and naming it in the list
	 */
	template<typename model_datatype>
	class detection_pipeline
	{
	public:
		static std::vector<std::string> default_mechanism_order()
		{
			return {"stiffness_conflict", "importance_weighted_clustering", "magnitude_fallback"};
		}

		detection_pipeline() : detection_pipeline(default_mechanism_order())
		{
		}

		explicit detection_pipeline(const std::vector<std::string>& mechanism_names)
		{
			register_detection_mechanisms<model_datatype>();
			for (const auto& name : mechanism_names)
			{
				auto mechanism = detection_mechanism<model_datatype>::create_mechanism_from_name(name);
				if (!mechanism) throw std::invalid_argument("unknown detection mechanism: " + name);
				_mechanisms.push_back(*mechanism);
			}
		}

		void process_client(client<model_datatype>& target, const detection_context<model_datatype>& context) const
		{
			for (const auto& mechanism : _mechanisms)
			{
				if (!mechanism->is_enabled(context.config)) continue;

				const detection_result<model_datatype> result = mechanism->evaluate(target, context);
				mechanism->record_score(target, result.score);
				if (result.rejected)
				{
					target.accepted = false;
					target.rejected_by = mechanism->get_name();
					break;
				}
			}
		}

		/// clients do not interact, so scoring them on several threads gives the same result
		void process(std::vector<client<model_datatype>>& clients, const detection_context<model_datatype>& context, size_t worker_threads = 1) const
		{
			tmt::ParallelExecution(static_cast<uint32_t>(worker_threads), [this, &context](uint32_t index, client<model_datatype>& target) {
				process_client(target, context);
			}, clients.size(), clients.data());
		}

		std::vector<std::string> get_mechanism_names() const
		{
			std::vector<std::string> output;
			for (const auto& mechanism : _mechanisms)
			{
				output.push_back(mechanism->get_name());
			}
			return output;
		}

	private:
		std::vector<std::shared_ptr<detection_mechanism<model_datatype>>> _mechanisms;
	};
}
