#pragma once

#include <fedshield/configure_file.hpp>
#include <fedshield/simulation_config.hpp>

inline fedshield::configuration_file::json get_default_simulation_configuration()
{
	fedshield::configuration_file::json output = fedshield::simulation_config().to_json();

	output["max_round"] = 100;
	output["round_interval_ms"] = 0; //500 replays the dashboard speed
	output["report_interval"] = 10;

	fedshield::configuration_file::json services = fedshield::configuration_file::json::object();
	{
		fedshield::configuration_file::json metrics_record = fedshield::configuration_file::json::object();
		metrics_record["enable"] = true;
		metrics_record["interval"] = 1;
		services["metrics_record"] = metrics_record;
	}
	{
		fedshield::configuration_file::json client_record = fedshield::configuration_file::json::object();
		client_record["enable"] = true;
		client_record["interval"] = 1;
		services["client_record"] = client_record;
	}
	{
		fedshield::configuration_file::json importance_record = fedshield::configuration_file::json::object();
		importance_record["enable"] = true;
		importance_record["interval"] = 1;
		services["importance_record"] = importance_record;
	}
	output["services"] = services;

	return output;
}
