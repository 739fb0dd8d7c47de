#define BOOST_TEST_MAIN
#include <boost/test/included/unit_test.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <fstream>
#include <stdexcept>
#include <filesystem>

#include <fedshield/configure_file.hpp>
#include <fedshield/simulation_config.hpp>
#include <fedshield/simulation_session.hpp>

namespace
{
	fedshield::config_status status_of(const fedshield::simulation_config& config)
	{
		return std::get<0>(config.validate());
	}

	int load_from_missing_folder(const std::filesystem::path& folder)
	{
		fedshield::configuration_file config;
		config.SetDefaultConfiguration(fedshield::simulation_config().to_json());
		return config.LoadConfiguration(folder / "not_existing_folder" / "simulator_config.json");
	}
}

BOOST_AUTO_TEST_SUITE (configuration_test)

	BOOST_AUTO_TEST_CASE (default_config_is_valid)
	{
		fedshield::simulation_config config;
		BOOST_CHECK(status_of(config) == fedshield::config_status::success);
		BOOST_CHECK(config.momentum_fim_enabled);
		BOOST_CHECK(config.stiffness_mask_enabled);
		BOOST_CHECK(config.layer_weighted_clustering_enabled);
		BOOST_CHECK_EQUAL(config.client_count, 20u);
		BOOST_CHECK_EQUAL(config.vector_dimension, 20u);
		BOOST_CHECK_CLOSE(config.attack_strength(), 0.9, 1e-9);
		BOOST_CHECK_EQUAL(config.malicious_client_count(), 4u);
	}

	BOOST_AUTO_TEST_CASE (out_of_range_values_are_rejected)
	{
		{
			fedshield::simulation_config config;
			config.non_iid_level = -0.1;
			BOOST_CHECK(status_of(config) == fedshield::config_status::out_of_range);
			config.non_iid_level = 2.1;
			BOOST_CHECK(status_of(config) == fedshield::config_status::out_of_range);
			config.non_iid_level = 2.0;
			BOOST_CHECK(status_of(config) == fedshield::config_status::success);
		}
		{
			fedshield::simulation_config config;
			config.attack_stealth = 0.95;
			BOOST_CHECK(status_of(config) == fedshield::config_status::out_of_range);
			config.attack_stealth = -0.01;
			BOOST_CHECK(status_of(config) == fedshield::config_status::out_of_range);
		}
		{
			fedshield::simulation_config config;
			config.malicious_ratio = 1.5;
			BOOST_CHECK(status_of(config) == fedshield::config_status::out_of_range);
			config.malicious_ratio = -0.2;
			BOOST_CHECK(status_of(config) == fedshield::config_status::out_of_range);
			config.malicious_ratio = 1.0;
			BOOST_CHECK(status_of(config) == fedshield::config_status::success);
		}
		{
			fedshield::simulation_config config;
			config.client_count = 0;
			BOOST_CHECK(status_of(config) == fedshield::config_status::out_of_range);
		}
		{
			fedshield::simulation_config config;
			config.detection_worker_threads = 0;
			BOOST_CHECK(status_of(config) == fedshield::config_status::out_of_range);
		}
	}

	BOOST_AUTO_TEST_CASE (non_finite_values_are_rejected)
	{
		fedshield::simulation_config config;
		config.non_iid_level = std::numeric_limits<double>::quiet_NaN();
		BOOST_CHECK(status_of(config) == fedshield::config_status::not_finite);
		config.non_iid_level = 0.5;
		config.attack_stealth = std::numeric_limits<double>::infinity();
		BOOST_CHECK(status_of(config) == fedshield::config_status::not_finite);
	}

	BOOST_AUTO_TEST_CASE (vector_dimension_must_cover_trigger_coordinates)
	{
		fedshield::simulation_config config;
		config.vector_dimension = 4;
		auto [status, message] = config.validate();
		BOOST_CHECK(status == fedshield::config_status::out_of_range);
		BOOST_CHECK(message.find("vector_dimension") != std::string::npos);

		config.vector_dimension = 5;
		BOOST_CHECK(status_of(config) == fedshield::config_status::success);
	}

	BOOST_AUTO_TEST_CASE (session_fails_fast_on_invalid_config)
	{
		fedshield::simulation_config config;
		config.malicious_ratio = 2.0;
		BOOST_CHECK_THROW(fedshield::simulation_session<double> session(config), std::invalid_argument);

		config.malicious_ratio = 0.2;
		config.vector_dimension = 3;
		BOOST_CHECK_THROW(fedshield::simulation_session<double> session(config), std::invalid_argument);
	}

	BOOST_AUTO_TEST_CASE (advance_rejects_invalid_config_and_keeps_state)
	{
		fedshield::simulation_config config;
		fedshield::simulation_session<double> session(config);
		auto state = session.initialize(config);
		state = session.advance(state, config);
		const auto state_copy = state;

		fedshield::simulation_config bad_config = config;
		bad_config.non_iid_level = -1.0;
		BOOST_CHECK_THROW(state = session.advance(state, bad_config), std::invalid_argument);
		BOOST_CHECK(state == state_copy);

		bad_config = config;
		bad_config.vector_dimension = 30;
		BOOST_CHECK_THROW(session.advance(state, bad_config), std::invalid_argument);

		bad_config = config;
		bad_config.seed = 7;
		BOOST_CHECK_THROW(session.advance(state, bad_config), std::invalid_argument);
	}

	BOOST_AUTO_TEST_CASE (advance_rejects_state_of_other_dimension)
	{
		fedshield::simulation_config config;
		fedshield::simulation_session<double> session(config);

		fedshield::simulation_config other_config = config;
		other_config.vector_dimension = 8;
		fedshield::simulation_session<double> other_session(other_config);
		auto other_state = other_session.initialize(other_config);

		BOOST_CHECK_THROW(session.advance(other_state, config), std::invalid_argument);
	}

	BOOST_AUTO_TEST_CASE (environment_may_change_between_rounds)
	{
		fedshield::simulation_config config;
		fedshield::simulation_session<double> session(config);
		auto state = session.initialize(config);
		state = session.advance(state, config);

		config.non_iid_level = 1.5;
		config.attack_stealth = 0.0;
		config.client_count = 30;
		config.malicious_ratio = 0.5;
		config.stiffness_mask_enabled = false;
		state = session.advance(state, config);
		BOOST_CHECK_EQUAL(state.round, 2);
		BOOST_CHECK_EQUAL(state.clients.size(), 30u);
	}

	BOOST_AUTO_TEST_CASE (configuration_file_defaults_and_override)
	{
		fedshield::configuration_file config;
		config.SetDefaultConfiguration(fedshield::simulation_config().to_json());

		fedshield::configuration_file::json data;
		data["non_iid_level"] = 1.25;
		data["client_count"] = 10;
		BOOST_CHECK_EQUAL(config.LoadConfigurationData(data.dump()), static_cast<int>(fedshield::configuration_file::loaded));

		BOOST_CHECK_CLOSE(*config.get<double>("non_iid_level"), 1.25, 1e-9);
		BOOST_CHECK_EQUAL(*config.get<int>("client_count"), 10);
		BOOST_CHECK_CLOSE(*config.get<double>("attack_stealth"), 0.6, 1e-9);
		BOOST_CHECK(!config.get<int>("not_existing").has_value());

		fedshield::simulation_config engine_config;
		auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
		BOOST_CHECK(status == fedshield::config_status::success);
		BOOST_CHECK_CLOSE(engine_config.non_iid_level, 1.25, 1e-9);
		BOOST_CHECK_EQUAL(engine_config.client_count, 10u);
		BOOST_CHECK_EQUAL(engine_config.seed, 42u);
	}

	BOOST_AUTO_TEST_CASE (configuration_vector)
	{
		fedshield::configuration_file configuration;
		fedshield::configuration_file::json data;
		data["1"] = fedshield::configuration_file::json::array({0,1,2,3,4});
		data["2"] = "text";

		BOOST_CHECK_EQUAL(configuration.LoadConfigurationData(data.dump()), static_cast<int>(fedshield::configuration_file::loaded));
		auto raw_data = *configuration.get_vec<int>("1");
		for (int i = 0; i < 5; ++i)
		{
			BOOST_CHECK(raw_data[i] == i);
		}
		BOOST_CHECK(!configuration.get_vec<int>("2").has_value());
		BOOST_CHECK(!configuration.get<int>("2").has_value());
	}

	BOOST_AUTO_TEST_CASE (configuration_file_rejects_malformed_data)
	{
		fedshield::configuration_file config;
		BOOST_CHECK_EQUAL(config.LoadConfigurationData("{not json"), static_cast<int>(fedshield::configuration_file::parse_error));
		BOOST_CHECK_EQUAL(config.LoadConfigurationData("[1,2,3]"), static_cast<int>(fedshield::configuration_file::parse_error));
	}

	BOOST_AUTO_TEST_CASE (from_configuration_reports_bad_items)
	{
		fedshield::configuration_file config;
		config.SetDefaultConfiguration(fedshield::simulation_config().to_json());
		fedshield::simulation_config engine_config;
		engine_config.client_count = 99;

		{
			fedshield::configuration_file::json data;
			data["malicious_ratio"] = 1.2;
			config.LoadConfigurationData(data.dump());
			auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
			BOOST_CHECK(status == fedshield::config_status::out_of_range);
		}
		{
			fedshield::configuration_file::json data;
			data["client_count"] = -3;
			config.LoadConfigurationData(data.dump());
			auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
			BOOST_CHECK(status == fedshield::config_status::out_of_range);
		}
		{
			fedshield::configuration_file::json data;
			data["stiffness_mask_enabled"] = "yes";
			config.LoadConfigurationData(data.dump());
			auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
			BOOST_CHECK(status == fedshield::config_status::missing_item);
		}
		{
			fedshield::configuration_file::json data;
			data["client_count"] = 20.7;
			config.LoadConfigurationData(data.dump());
			auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
			BOOST_CHECK(status == fedshield::config_status::missing_item);
			BOOST_CHECK(message.find("client_count") != std::string::npos);
		}
		{
			fedshield::configuration_file::json data;
			data["vector_dimension"] = 20.0;
			config.LoadConfigurationData(data.dump());
			auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
			BOOST_CHECK(status == fedshield::config_status::missing_item);
		}
		{
			fedshield::configuration_file::json data;
			data["seed"] = -1;
			config.LoadConfigurationData(data.dump());
			auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
			BOOST_CHECK(status == fedshield::config_status::out_of_range);
		}
		{
			fedshield::configuration_file::json data;
			data["seed"] = 4294967296LL;
			config.LoadConfigurationData(data.dump());
			auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
			BOOST_CHECK(status == fedshield::config_status::out_of_range);
		}
		//the output is untouched when reading fails
		BOOST_CHECK_EQUAL(engine_config.client_count, 99u);

		{
			fedshield::configuration_file::json data;
			data["seed"] = 4294967295LL;
			config.LoadConfigurationData(data.dump());
			auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
			BOOST_CHECK(status == fedshield::config_status::success);
			BOOST_CHECK_EQUAL(engine_config.seed, 4294967295u);
		}
	}

	BOOST_AUTO_TEST_CASE (missing_configuration_file_is_created)
	{
		const std::filesystem::path folder = std::filesystem::temp_directory_path() / "fedshield_configuration_test";
		std::filesystem::remove_all(folder);
		std::filesystem::create_directories(folder);
		const std::filesystem::path path = folder / "simulator_config.json";

		{
			fedshield::configuration_file config;
			config.SetDefaultConfiguration(fedshield::simulation_config().to_json());
			BOOST_CHECK_EQUAL(config.LoadConfiguration(path), static_cast<int>(fedshield::configuration_file::created_from_default));
			BOOST_CHECK(std::filesystem::exists(path));
			BOOST_CHECK_EQUAL(*config.get<int>("client_count"), 20);
		}

		//edit the written file, a second load reads it instead of the defaults
		{
			std::ifstream input(path);
			auto written = fedshield::configuration_file::json::parse(input);
			BOOST_CHECK(written == fedshield::simulation_config().to_json());
			written["client_count"] = 7;
			input.close();
			std::ofstream output(path, std::ios::binary);
			output << written.dump(4);
		}
		{
			fedshield::configuration_file config;
			config.SetDefaultConfiguration(fedshield::simulation_config().to_json());
			BOOST_CHECK_EQUAL(config.LoadConfiguration(path), static_cast<int>(fedshield::configuration_file::loaded));
			BOOST_CHECK_EQUAL(*config.get<int>("client_count"), 7);
		}

		{
			std::ofstream output(path, std::ios::binary);
			output << "{ broken";
		}
		{
			fedshield::configuration_file config;
			config.SetDefaultConfiguration(fedshield::simulation_config().to_json());
			BOOST_CHECK_EQUAL(config.LoadConfiguration(path), static_cast<int>(fedshield::configuration_file::parse_error));
		}

		BOOST_CHECK_EQUAL(load_from_missing_folder(folder), static_cast<int>(fedshield::configuration_file::io_error));
		std::filesystem::remove_all(folder);
	}

BOOST_AUTO_TEST_SUITE_END()
