#pragma once

#include "vector_math.hpp"

namespace fedshield
{
	/// momentum-filtered importance ("FIM"), an EMA towards the ideal profile: 10 on trigger coordinates, 1 elsewhere
	template<typename model_datatype>
	class importance_estimator
	{
	public:
		static constexpr model_datatype decay = 0.9;
		static constexpr model_datatype momentum = 0.1;
		static constexpr model_datatype high_importance_value = 10.0;
		static constexpr model_datatype low_importance_value = 1.0;
		static constexpr model_datatype initial_value = 1.0;

		static vector_type<model_datatype> initial_importance(size_t dimension)
		{
			return vector_type<model_datatype>(dimension, initial_value);
		}

		static vector_type<model_datatype> ideal_importance(size_t dimension)
		{
			vector_type<model_datatype> output(dimension);
			for (size_t j = 0; j < dimension; ++j)
			{
				output[j] = is_high_importance(j) ? high_importance_value : low_importance_value;
			}
			return output;
		}

		/// the update uses the previous estimate only, never the current round's gradients
		static vector_type<model_datatype> update(const vector_type<model_datatype>& previous, bool enabled)
		{
			if (!enabled) return previous;

			const vector_type<model_datatype> ideal = ideal_importance(previous.size());
			vector_type<model_datatype> output(previous.size());
			for (size_t j = 0; j < previous.size(); ++j)
			{
				output[j] = decay * previous[j] + momentum * ideal[j];
			}
			return output;
		}
	};
}
