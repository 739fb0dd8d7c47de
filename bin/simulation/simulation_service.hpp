#pragma once

#include <tuple>
#include <memory>
#include <string>
#include <fstream>
#include <filesystem>

#include <glog/logging.h>

#include <fedshield/configure_file.hpp>
#include <fedshield/round_state.hpp>
#include <fedshield/round_summary.hpp>
#include <fedshield/aggregator.hpp>

enum class service_status
{
	success,
	fail_not_specified_reason,
	fail_config_item_missing,
	fail_cannot_open_file,
	skipped
};

/// a recorder fed with every completed round, the engine never knows about it
template <typename model_datatype>
class service
{
public:
	bool enable;

	service()
	{
		enable = false;
		interval = 1;
	}

	virtual ~service() = default;

	virtual std::tuple<service_status, std::string> apply_config(const fedshield::configuration_file::json& config)
	{
		if (!config.contains("enable") || !config["enable"].is_boolean()) return {service_status::fail_config_item_missing, "\"enable\" is missing"};
		if (!config.contains("interval") || !config["interval"].is_number_integer()) return {service_status::fail_config_item_missing, "\"interval\" is missing"};
		this->enable = config["enable"];
		this->interval = config["interval"];
		if (this->interval < 1) return {service_status::fail_not_specified_reason, "\"interval\" must be at least 1"};
		return {service_status::success, ""};
	}

	virtual std::tuple<service_status, std::string> init_service(const std::filesystem::path& output_path) = 0;

	virtual std::tuple<service_status, std::string> process_per_round(const fedshield::round_state<model_datatype>& state) = 0;

	virtual std::tuple<service_status, std::string> destruction_service()
	{
		if (output_file) output_file->flush();
		output_file.reset();
		return {service_status::success, ""};
	}

protected:
	std::tuple<service_status, std::string> open_output(const std::filesystem::path& path)
	{
		output_file.reset(new std::ofstream(path, std::ios::binary));
		if (!output_file->is_open()) return {service_status::fail_cannot_open_file, "cannot open " + path.string()};
		return {service_status::success, ""};
	}

	bool should_process(int round) const
	{
		return this->enable && round % interval == 0;
	}

	int interval;
	std::unique_ptr<std::ofstream> output_file;
};

template <typename model_datatype>
class metrics_record : public service<model_datatype>
{
public:
	std::tuple<service_status, std::string> init_service(const std::filesystem::path& output_path) override
	{
		if (!this->enable) return {service_status::skipped, "not enabled"};
		auto result = this->open_output(output_path / "metrics.csv");
		if (std::get<0>(result) != service_status::success) return result;
		*this->output_file << "round,accuracy,attack_success_rate,accepted,malicious_accepted,detected_malicious,false_positive" << std::endl;
		return {service_status::success, ""};
	}

	std::tuple<service_status, std::string> process_per_round(const fedshield::round_state<model_datatype>& state) override
	{
		if (!this->should_process(state.round)) return {service_status::skipped, "not time yet"};

		const auto statistics = fedshield::aggregator<model_datatype>::count_acceptance(state.clients);
		const auto summary = fedshield::round_summary<model_datatype>::create(state);
		*this->output_file << state.round << "," << state.global_accuracy << "," << state.backdoor_success_rate << ","
		                   << statistics.accepted_count << "," << statistics.malicious_accepted << ","
		                   << summary.malicious_detected << "," << summary.benign_rejected << std::endl;
		return {service_status::success, ""};
	}
};

template <typename model_datatype>
class client_record : public service<model_datatype>
{
public:
	std::tuple<service_status, std::string> init_service(const std::filesystem::path& output_path) override
	{
		if (!this->enable) return {service_status::skipped, "not enabled"};
		auto result = this->open_output(output_path / "clients.csv");
		if (std::get<0>(result) != service_status::success) return result;
		*this->output_file << "round,id,type,data_distribution,stiffness_score,clustering_distance,accepted,rejected_by,projection_x,projection_y" << std::endl;
		return {service_status::success, ""};
	}

	std::tuple<service_status, std::string> process_per_round(const fedshield::round_state<model_datatype>& state) override
	{
		if (!this->should_process(state.round)) return {service_status::skipped, "not time yet"};

		for (const auto& single_client : state.clients)
		{
			const auto projection = fedshield::round_summary<model_datatype>::project(single_client);
			*this->output_file << state.round << "," << single_client.id << "," << single_client.type << ","
			                   << single_client.data_distribution << "," << single_client.stiffness_score << ","
			                   << single_client.clustering_distance << "," << (single_client.accepted ? 1 : 0) << ","
			                   << single_client.rejected_by << "," << projection.x << "," << projection.y << std::endl;
		}
		return {service_status::success, ""};
	}
};

template <typename model_datatype>
class importance_record : public service<model_datatype>
{
public:
	explicit importance_record(size_t dimension) : _dimension(dimension)
	{
	}

	std::tuple<service_status, std::string> init_service(const std::filesystem::path& output_path) override
	{
		if (!this->enable) return {service_status::skipped, "not enabled"};
		auto result = this->open_output(output_path / "importance.csv");
		if (std::get<0>(result) != service_status::success) return result;
		*this->output_file << "round";
		for (size_t j = 0; j < _dimension; ++j)
		{
			*this->output_file << "," << j;
		}
		*this->output_file << std::endl;
		return {service_status::success, ""};
	}

	std::tuple<service_status, std::string> process_per_round(const fedshield::round_state<model_datatype>& state) override
	{
		if (!this->should_process(state.round)) return {service_status::skipped, "not time yet"};

		*this->output_file << state.round;
		for (const auto& value : state.importance)
		{
			*this->output_file << "," << value;
		}
		*this->output_file << std::endl;
		return {service_status::success, ""};
	}

private:
	size_t _dimension;
};
