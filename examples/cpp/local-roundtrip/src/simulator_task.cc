#include "simulator_task.hpp"

#include "omotes/helpers.hpp"
#include "omotes/logging.hpp"
#include "omotes/workflow_type.hpp"

namespace roundtrip {

std::string run_simulator(const std::string& input_esdl,
                          const google::protobuf::Struct& workflow_config,
                          const omotes::UpdateProgressHandler& update_progress) {
    auto timestep_count = omotes::parse_workflow_config_parameter<omotes::IntegerParameter>(
        workflow_config, "timestep_count", int64_t{4});
    auto start_time = omotes::parse_workflow_config_parameter<omotes::DateTimeParameter>(
        workflow_config, "start_time");
    auto mode = omotes::parse_workflow_config_parameter<omotes::StringParameter>(
        workflow_config, "mode", std::string("fast"));

    omotes::log_info("simulator", "simulation_started",
                     {{"timestep_count", timestep_count},
                      {"start_time", omotes::helpers::format_iso8601(start_time)},
                      {"mode", mode}});

    for (int64_t step = 1; step < timestep_count; ++step) {
        update_progress(static_cast<double>(step) / static_cast<double>(timestep_count),
                        "Simulated time step " + std::to_string(step));
    }

    return input_esdl + "<!-- simulated " + std::to_string(timestep_count) + " steps (" + mode + ") -->";
}

}  // namespace roundtrip
