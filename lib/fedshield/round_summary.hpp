#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <ostream>

#include "client.hpp"
#include "round_state.hpp"

namespace fedshield
{
	enum class accuracy_trend
	{
		none,
		up,
		down,
		flat,
	};

	inline std::ostream& operator << (std::ostream& os, const accuracy_trend& x)
	{
		switch (x)
		{
			case accuracy_trend::none:
				os << "none";
				break;
			case accuracy_trend::up:
				os << "up";
				break;
			case accuracy_trend::down:
				os << "down";
				break;
			case accuracy_trend::flat:
				os << "flat";
				break;
		}
		return os;
	}

	template<typename model_datatype>
	struct client_projection
	{
		size_t id = 0;
		model_datatype x = 0;
		model_datatype y = 0;
		client_type type = client_type::benign;
		bool accepted = true;
		model_datatype stiffness_score = 0;
	};

	/// read-only view of a round for reports: detection counts, trend, alarm and a 2-D projection of every client
	template<typename model_datatype>
	struct round_summary
	{
		static constexpr model_datatype attack_success_alarm_threshold = 0.1;

		int round = 0;
		size_t malicious_total = 0;
		size_t malicious_detected = 0;
		size_t benign_rejected = 0;
		size_t accepted_count = 0;
		accuracy_trend trend = accuracy_trend::none;
		bool attack_success_alarm = false;
		std::vector<client_projection<model_datatype>> projections;

		/// gradient coordinates 0..3 folded onto a plane, x = g0 + g2 / 2, y = g1 + g3 / 2
		static client_projection<model_datatype> project(const client<model_datatype>& target)
		{
			client_projection<model_datatype> output;
			output.id = target.id;
			output.type = target.type;
			output.accepted = target.accepted;
			output.stiffness_score = target.stiffness_score;
			output.x = target.gradient[0] + target.gradient[2] * static_cast<model_datatype>(0.5);
			output.y = target.gradient[1] + target.gradient[3] * static_cast<model_datatype>(0.5);
			return output;
		}

		static round_summary create(const round_state<model_datatype>& state)
		{
			round_summary output;
			output.round = state.round;
			for (const auto& single_client : state.clients)
			{
				if (single_client.type == client_type::malicious)
				{
					output.malicious_total++;
					if (!single_client.accepted) output.malicious_detected++;
				}
				else if (!single_client.accepted)
				{
					output.benign_rejected++;
				}
				if (single_client.accepted) output.accepted_count++;
				output.projections.push_back(project(single_client));
			}

			if (state.history.size() >= 2)
			{
				const model_datatype last = state.history[state.history.size() - 1].accuracy;
				const model_datatype before_last = state.history[state.history.size() - 2].accuracy;
				if (last > before_last) output.trend = accuracy_trend::up;
				else if (last < before_last) output.trend = accuracy_trend::down;
				else output.trend = accuracy_trend::flat;
			}

			output.attack_success_alarm = state.backdoor_success_rate > attack_success_alarm_threshold;
			return output;
		}
	};
}
