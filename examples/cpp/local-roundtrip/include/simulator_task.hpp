#pragma once

#include <string>
#include <google/protobuf/struct.pb.h>
#include "omotes/worker.hpp"

namespace roundtrip {

/// Worker task for the "simulator" workflow.
std::string run_simulator(const std::string& input_esdl,
                          const google::protobuf::Struct& workflow_config,
                          const omotes::UpdateProgressHandler& update_progress);

}  // namespace roundtrip
