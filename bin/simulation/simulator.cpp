#include <ctime>
#include <chrono>
#include <thread>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <unordered_map>

#include <boost/format.hpp>

#include <glog/logging.h>

#include <fedshield.hpp>

#include "../env.hpp"
#include "./default_simulation_config.hpp"
#include "./simulation_service.hpp"

/** assumptions in this simulator:
 *  (1) clients are regenerated every round, only the importance vector and the metrics persist
 *  (2) no real training, gradients are synthetic
 *
 */

using model_datatype = double;

std::atomic_bool stop_requested = false;

void signal_handler(int sig_num)
{
	stop_requested = true;
}

std::string time_to_text(std::chrono::system_clock::time_point time)
{
	std::time_t time_t_value = std::chrono::system_clock::to_time_t(time);
	std::tm time_tm = *std::gmtime(&time_t_value);
	std::ostringstream ss;
	ss << std::put_time(&time_tm, "%Y-%m-%d_%H-%M-%S");
	return ss.str();
}

int main(int argc, char *argv[])
{
	const std::filesystem::path config_file_path = CONFIG_FILE_NAME::SIMULATOR;

	//create new folder
	std::filesystem::path output_path = std::filesystem::current_path() / time_to_text(std::chrono::system_clock::now());
	std::filesystem::create_directories(output_path);

	//log file path
	google::InitGoogleLogging(argv[0]);
	std::filesystem::path log_path(output_path / "log");
	if (!std::filesystem::exists(log_path)) std::filesystem::create_directories(log_path);
	google::SetLogDestination(google::INFO, (log_path.string() + "/").c_str());

	//load configuration
	fedshield::configuration_file config;
	config.SetDefaultConfiguration(get_default_simulation_configuration());
	auto load_config_rc = config.LoadConfiguration(config_file_path);
	if (load_config_rc < 0)
	{
		LOG(FATAL) << "cannot load configuration file, wrong format?";
		return -1;
	}
	LOG_IF(INFO, load_config_rc == fedshield::configuration_file::created_from_default) << config_file_path << " does not exist, default configuration written";
	auto& config_json = config.get_json();

	//backup configuration file
	{
		std::ofstream backup(output_path / config_file_path.filename(), std::ios::binary);
		backup << config_json.dump(4);
	}

	fedshield::simulation_config engine_config;
	{
		auto [status, message] = fedshield::simulation_config::from_configuration(config, engine_config);
		if (status != fedshield::config_status::success)
		{
			LOG(FATAL) << "invalid configuration: " << message;
			return -1;
		}
	}

	auto max_round = config.get<int>("max_round");
	auto round_interval_ms = config.get<int>("round_interval_ms");
	auto report_interval = config.get<int>("report_interval");
	LOG_IF(FATAL, !max_round || *max_round < 0) << "max_round must be a non-negative integer";
	LOG_IF(FATAL, !round_interval_ms || *round_interval_ms < 0) << "round_interval_ms must be a non-negative integer";
	LOG_IF(FATAL, !report_interval || *report_interval < 1) << "report_interval must be a positive integer";

	LOG(INFO) << "configuration: " << engine_config.to_json().dump();

	////services
	std::unordered_map<std::string, std::shared_ptr<service<model_datatype>>> services;
	{
		services.emplace("metrics_record", new metrics_record<model_datatype>());
		services.emplace("client_record", new client_record<model_datatype>());
		services.emplace("importance_record", new importance_record<model_datatype>(engine_config.vector_dimension));
		auto services_json = config_json["services"];
		LOG_IF(FATAL, services_json.is_null()) << "services are not defined in configuration file";

		for (auto& [name, service_instance] : services)
		{
			auto service_config = services_json[name];
			LOG_IF(FATAL, service_config.is_null()) << "service: \"" << name << "\" config item is empty";
			{
				auto [status, message] = service_instance->apply_config(service_config);
				LOG_IF(FATAL, status != service_status::success) << "service: \"" << name << "\" " << message;
			}
			{
				auto [status, message] = service_instance->init_service(output_path);
				LOG_IF(FATAL, status != service_status::success && status != service_status::skipped) << "service: \"" << name << "\" " << message;
			}
		}
	}

	signal(SIGINT, signal_handler);

	////////////  BEGIN SIMULATION  ////////////
	fedshield::simulation_session<model_datatype> session(engine_config);
	fedshield::round_state<model_datatype> state = session.initialize(engine_config);
	{
		auto last_time_point = std::chrono::system_clock::now();

		while (state.round < *max_round)
		{
			if (stop_requested)
			{
				LOG(INFO) << "stop requested, simulation ends at round " << state.round;
				break;
			}

			state = session.advance(state, engine_config);

			const auto summary = fedshield::round_summary<model_datatype>::create(state);
			std::string log_msg = (boost::format("round: %1%, accuracy: %2%, asr: %3%, detected: %4%/%5%, false positive: %6%, trend: %7%")
				% state.round % state.global_accuracy % state.backdoor_success_rate % summary.malicious_detected % summary.malicious_total % summary.benign_rejected % summary.trend).str();
			LOG(INFO) << log_msg;
			LOG_IF(WARNING, summary.attack_success_alarm) << "round " << state.round << ": backdoor success rate " << state.backdoor_success_rate << " is above " << fedshield::round_summary<model_datatype>::attack_success_alarm_threshold;

			if (state.round % *report_interval == 0)
			{
				auto now = std::chrono::system_clock::now();
				std::chrono::duration<float, std::milli> time_elapsed_ms = now - last_time_point;
				last_time_point = now;
				std::cout << log_msg << " (" << std::setprecision(3) << time_elapsed_ms.count() / float(*report_interval) << "ms/round)" << std::endl;
			}

			for (auto& [name, service_instance] : services)
			{
				auto [status, message] = service_instance->process_per_round(state);
				LOG_IF(ERROR, status != service_status::success && status != service_status::skipped) << "service: \"" << name << "\" " << message;
			}

			if (*round_interval_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(*round_interval_ms));
		}
	}

	for (auto& [name, service_instance] : services)
	{
		auto [status, message] = service_instance->destruction_service();
		LOG_IF(ERROR, status != service_status::success) << "service: \"" << name << "\" " << message;
	}

	std::cout << "simulation finished at round " << state.round << ", output: " << output_path << std::endl;
	return 0;
}
