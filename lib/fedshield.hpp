#pragma once

#include "fedshield/vector_math.hpp"
#include "fedshield/configure_file.hpp"
#include "fedshield/simulation_config.hpp"
#include "fedshield/client.hpp"
#include "fedshield/client_generator.hpp"
#include "fedshield/importance_estimator.hpp"
#include "fedshield/detection_mechanism.hpp"
#include "fedshield/detection_pipeline.hpp"
#include "fedshield/aggregator.hpp"
#include "fedshield/round_state.hpp"
#include "fedshield/round_summary.hpp"
#include "fedshield/simulation_session.hpp"
#include "fedshield/defense_comparison.hpp"
