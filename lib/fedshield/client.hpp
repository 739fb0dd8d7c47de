#pragma once

#include <sstream>
#include <string>
#include <ostream>

#include "vector_math.hpp"

namespace fedshield
{
	enum class client_type
	{
		benign,
		malicious,
	};

	inline std::ostream& operator << (std::ostream& os, const client_type& x)
	{
		switch (x)
		{
			case client_type::benign:
				os << "benign";
				break;
			case client_type::malicious:
				os << "malicious";
				break;
		}
		return os;
	}

	inline std::string to_string(const client_type& x)
	{
		std::ostringstream ss;
		ss << x;
		return ss.str();
	}

	/// one simulated participant of a single round, clients are regenerated every round
	template<typename model_datatype>
	struct client
	{
		size_t id = 0;
		client_type type = client_type::benign;
		model_datatype data_distribution = 0;
		vector_type<model_datatype> gradient;

		model_datatype stiffness_score = 0;     //0 if the stiffness mechanism was not evaluated
		model_datatype clustering_distance = 0; //0 if the clustering mechanism was not evaluated
		bool accepted = true;
		std::string rejected_by;                //empty when accepted

		bool operator==(const client&) const = default;
	};
}
