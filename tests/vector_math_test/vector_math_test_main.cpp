#define BOOST_TEST_MAIN
#include <boost/test/included/unit_test.hpp>

#include <cmath>
#include <vector>

#include <fedshield/vector_math.hpp>

BOOST_AUTO_TEST_SUITE (vector_math_test)

	BOOST_AUTO_TEST_CASE (dot_product)
	{
		std::vector<double> a = {1.0, 2.0, 3.0};
		std::vector<double> b = {4.0, -5.0, 6.0};
		BOOST_CHECK_CLOSE(fedshield::vector_math::dot(a, b), 12.0, 1e-9);
		BOOST_CHECK_CLOSE(fedshield::vector_math::dot(a, a), 14.0, 1e-9);

		std::vector<double> zero(3, 0.0);
		BOOST_CHECK_EQUAL(fedshield::vector_math::dot(a, zero), 0.0);
	}

	BOOST_AUTO_TEST_CASE (magnitude)
	{
		std::vector<double> a = {3.0, 4.0};
		BOOST_CHECK_CLOSE(fedshield::vector_math::magnitude(a), 5.0, 1e-9);

		std::vector<double> b(20, -1.0);
		BOOST_CHECK_CLOSE(fedshield::vector_math::magnitude(b), std::sqrt(20.0), 1e-9);

		std::vector<float> c = {0.0f, 0.0f};
		BOOST_CHECK_EQUAL(fedshield::vector_math::magnitude(c), 0.0f);
	}

	BOOST_AUTO_TEST_CASE (trigger_coordinates)
	{
		for (size_t i = 0; i < 5; ++i)
		{
			BOOST_CHECK(fedshield::is_high_importance(i));
		}
		BOOST_CHECK(!fedshield::is_high_importance(5));
		BOOST_CHECK(!fedshield::is_high_importance(19));
	}

	BOOST_AUTO_TEST_CASE (seeded_source_is_reproducible)
	{
		fedshield::random_source source_a(42), source_b(42), source_c(43);
		bool all_equal = true, any_different = false;
		for (int i = 0; i < 1000; ++i)
		{
			const double a = fedshield::vector_math::standard_normal<double>(source_a);
			const double b = fedshield::vector_math::standard_normal<double>(source_b);
			const double c = fedshield::vector_math::standard_normal<double>(source_c);
			if (a != b) all_equal = false;
			if (a != c) any_different = true;
		}
		BOOST_CHECK(all_equal);
		BOOST_CHECK(any_different);
		BOOST_CHECK_EQUAL(source_a.seed(), 42u);
	}

	BOOST_AUTO_TEST_CASE (uniform_draws_in_unit_interval)
	{
		fedshield::random_source source(7);
		for (int i = 0; i < 10000; ++i)
		{
			const double u = source.uniform();
			BOOST_REQUIRE(u >= 0.0);
			BOOST_REQUIRE(u < 1.0);
		}
	}

	BOOST_AUTO_TEST_CASE (standard_normal_moments)
	{
		fedshield::random_source source(2024);
		const int sample_size = 50000;
		double sum = 0.0, sum_square = 0.0;
		for (int i = 0; i < sample_size; ++i)
		{
			const double value = fedshield::vector_math::standard_normal<double>(source);
			BOOST_REQUIRE(std::isfinite(value));
			sum += value;
			sum_square += value * value;
		}
		const double mean = sum / sample_size;
		const double variance = sum_square / sample_size - mean * mean;
		BOOST_CHECK_SMALL(mean, 0.03);
		BOOST_CHECK_SMALL(variance - 1.0, 0.05);
	}

	BOOST_AUTO_TEST_CASE (standard_normal_vector)
	{
		fedshield::random_source source_a(42), source_b(42);
		auto vector_a = fedshield::vector_math::standard_normal_vector<double>(source_a, 20);
		BOOST_CHECK_EQUAL(vector_a.size(), 20u);

		//a vector is the same as 20 single draws in order
		for (size_t i = 0; i < vector_a.size(); ++i)
		{
			BOOST_CHECK_EQUAL(vector_a[i], fedshield::vector_math::standard_normal<double>(source_b));
		}
	}

BOOST_AUTO_TEST_SUITE_END()
