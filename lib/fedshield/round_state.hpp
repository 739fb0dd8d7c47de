#pragma once

#include <deque>
#include <vector>

#include "client.hpp"
#include "vector_math.hpp"

namespace fedshield
{
	template<typename model_datatype>
	struct history_entry
	{
		int round = 0;
		model_datatype accuracy = 0;
		model_datatype attack_success_rate = 0;

		bool operator==(const history_entry&) const = default;
	};

	/// the engine state, replaced as a whole by every round transition
	template<typename model_datatype>
	struct round_state
	{
		static constexpr size_t history_capacity = 50;
		static constexpr model_datatype initial_accuracy = 0.1;
		static constexpr model_datatype initial_attack_success_rate = 0.0;

		int round = 0;
		model_datatype global_accuracy = initial_accuracy;
		model_datatype backdoor_success_rate = initial_attack_success_rate;
		vector_type<model_datatype> importance;
		std::vector<client<model_datatype>> clients;
		std::deque<history_entry<model_datatype>> history; //oldest first, at most history_capacity entries

		bool operator==(const round_state&) const = default;
	};
}
