#pragma once

#include <cmath>
#include <cstdint>
#include <random>
#include <vector>
#include <numbers>

namespace fedshield
{
	template<typename model_datatype>
	using vector_type = std::vector<model_datatype>;

	/// indices [0, high_importance_dimension) are the trigger coordinates
	constexpr size_t high_importance_dimension = 5;

	inline bool is_high_importance(size_t index)
	{
		return index < high_importance_dimension;
	}

	/// seedable source of uniform(0,1) draws, one per simulation session
	class random_source
	{
	public:
		using engine_type = std::mt19937;

		explicit random_source(uint32_t seed) : _seed(seed), _engine(seed), _distribution(0.0, 1.0)
		{
		}

		double uniform()
		{
			return _distribution(_engine);
		}

		uint32_t seed() const
		{
			return _seed;
		}

	private:
		uint32_t _seed;
		engine_type _engine;
		std::uniform_real_distribution<double> _distribution;
	};

	namespace vector_math
	{
		template<typename model_datatype>
		model_datatype dot(const vector_type<model_datatype>& lhs, const vector_type<model_datatype>& rhs)
		{
			model_datatype sum = 0;
			for (size_t i = 0; i < lhs.size(); ++i)
			{
				sum += lhs[i] * rhs[i];
			}
			return sum;
		}

		template<typename model_datatype>
		model_datatype magnitude(const vector_type<model_datatype>& data)
		{
			return std::sqrt(dot(data, data));
		}

		/// Box-Muller transform, a draw of exactly 0 is discarded to keep log() finite
		template<typename model_datatype>
		model_datatype standard_normal(random_source& source)
		{
			double u = 0.0, v = 0.0;
			while (u == 0.0) u = source.uniform();
			while (v == 0.0) v = source.uniform();
			return static_cast<model_datatype>(std::sqrt(-2.0 * std::log(u)) * std::cos(2.0 * std::numbers::pi * v));
		}

		template<typename model_datatype>
		vector_type<model_datatype> standard_normal_vector(random_source& source, size_t dimension)
		{
			vector_type<model_datatype> output;
			output.reserve(dimension);
			for (size_t i = 0; i < dimension; ++i)
			{
				output.push_back(standard_normal<model_datatype>(source));
			}
			return output;
		}
	}
}
