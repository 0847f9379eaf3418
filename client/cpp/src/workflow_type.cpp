#include "omotes/workflow_type.hpp"

#include <fstream>

namespace omotes {

namespace {

std::string required_string(const nlohmann::json& workflow_config, const char* key) {
    auto it = workflow_config.find(key);
    if (it == workflow_config.end()) {
        throw MissingFieldException(std::string("'") + key + "' is missing for workflow");
    }
    if (!it->is_string()) {
        throw WrongFieldTypeException(std::string("'") + key + "' for workflow must be in 'str' format: '" +
                                      it->dump() + "'");
    }
    return it->get<std::string>();
}

std::vector<WorkflowParameter> parameters_from_json(const std::string& workflow_type_name,
                                                    const nlohmann::json& parameters_config) {
    if (!parameters_config.is_array()) {
        throw WrongFieldTypeException("'workflow_parameters' for workflow " + workflow_type_name +
                                      " must be a 'list'");
    }

    std::vector<WorkflowParameter> parameters;
    for (const auto& parameter_config : parameters_config) {
        if (!parameter_config.is_object()) {
            throw WrongFieldTypeException("Parameter for workflow " + workflow_type_name +
                                          " must be an object: '" + parameter_config.dump() + "'");
        }
        auto type_it = parameter_config.find("parameter_type");
        if (type_it == parameter_config.end()) {
            throw MissingFieldException("'parameter_type' is missing for a parameter of workflow " +
                                        workflow_type_name);
        }
        if (!type_it->is_string()) {
            throw WrongFieldTypeException("'parameter_type' must be in 'str' format: '" +
                                          type_it->dump() + "'");
        }

        nlohmann::json definition = parameter_config;
        definition.erase("parameter_type");

        auto parameter = workflow_parameter_from_json_config(type_it->get<std::string>(), definition);
        if (!parameter) {
            log_warning(log_domains::SDK, "Skipping workflow parameter with unknown parameter type",
                        {{"workflow_type", workflow_type_name},
                         {"parameter_type", type_it->get<std::string>()}});
            continue;
        }
        parameters.push_back(std::move(*parameter));
    }
    return parameters;
}

} // namespace

WorkflowTypeManager::WorkflowTypeManager(std::vector<WorkflowType> possible_workflows) {
    for (auto& workflow : possible_workflows) {
        std::string name = workflow.workflow_type_name();
        auto it = workflows_.find(name);
        if (it != workflows_.end()) {
            it->second = std::move(workflow);
        } else {
            workflows_.emplace(name, std::move(workflow));
            order_.push_back(std::move(name));
        }
    }
}

WorkflowTypeManager WorkflowTypeManager::from_json_config_file(const std::string& json_config_file_path) {
    std::ifstream file(json_config_file_path);
    if (!file) {
        throw ConfigError("Could not open workflow configuration file: " + json_config_file_path);
    }

    nlohmann::json json_config;
    try {
        json_config = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Invalid JSON in workflow configuration file " + json_config_file_path +
                          ": " + e.what());
    }
    return from_json_config(json_config);
}

WorkflowTypeManager WorkflowTypeManager::from_json_config(const nlohmann::json& json_config) {
    if (!json_config.is_array()) {
        throw ConfigError("Workflow configuration must be a list of workflows");
    }

    std::vector<WorkflowType> workflow_types;
    for (const auto& workflow_config : json_config) {
        if (!workflow_config.is_object()) {
            throw ConfigError("Workflow definition must be an object: '" + workflow_config.dump() + "'");
        }
        std::string name = required_string(workflow_config, "workflow_type_name");
        std::string description = required_string(workflow_config, "workflow_type_description_name");

        std::optional<std::vector<WorkflowParameter>> parameters;
        auto parameters_it = workflow_config.find("workflow_parameters");
        if (parameters_it != workflow_config.end()) {
            parameters = parameters_from_json(name, *parameters_it);
        }
        workflow_types.emplace_back(std::move(name), std::move(description), std::move(parameters));
    }

    WorkflowTypeManager manager(std::move(workflow_types));
    log_debug(log_domains::SDK, "Loaded workflow configuration", {{"workflows", manager.size()}});
    return manager;
}

WorkflowTypeManager WorkflowTypeManager::from_pb_message(
    const protocol::AvailableWorkflows& available_workflows_pb) {
    std::vector<WorkflowType> workflow_types;
    workflow_types.reserve(available_workflows_pb.workflows_size());

    for (const auto& workflow_pb : available_workflows_pb.workflows()) {
        std::vector<WorkflowParameter> parameters;
        parameters.reserve(workflow_pb.parameters_size());
        for (const auto& parameter_pb : workflow_pb.parameters()) {
            parameters.push_back(workflow_parameter_from_pb_message(parameter_pb));
        }
        workflow_types.emplace_back(workflow_pb.type_name(), workflow_pb.type_description(),
                                    std::move(parameters));
    }
    return WorkflowTypeManager(std::move(workflow_types));
}

protocol::AvailableWorkflows WorkflowTypeManager::to_pb_message() const {
    protocol::AvailableWorkflows available_workflows_pb;
    for (const auto& name : order_) {
        const WorkflowType& workflow = workflows_.at(name);

        auto* workflow_pb = available_workflows_pb.add_workflows();
        workflow_pb->set_type_name(workflow.workflow_type_name());
        workflow_pb->set_type_description(workflow.workflow_type_description_name());
        if (workflow.workflow_parameters()) {
            for (const auto& parameter : *workflow.workflow_parameters()) {
                *workflow_pb->add_parameters() = workflow_parameter_to_pb_message(parameter);
            }
        }
    }
    return available_workflows_pb;
}

const WorkflowType* WorkflowTypeManager::get_workflow_by_name(const std::string& name) const {
    auto it = workflows_.find(name);
    return it != workflows_.end() ? &it->second : nullptr;
}

std::vector<WorkflowType> WorkflowTypeManager::get_all_workflows() const {
    std::vector<WorkflowType> result;
    result.reserve(order_.size());
    for (const auto& name : order_) {
        result.push_back(workflows_.at(name));
    }
    return result;
}

bool WorkflowTypeManager::workflow_exists(const WorkflowType& workflow) const {
    return workflows_.count(workflow.workflow_type_name()) > 0;
}

google::protobuf::Struct convert_params_dict_to_struct(const WorkflowType& workflow,
                                                       const ParamsDict& params_dict) {
    google::protobuf::Struct params_struct;
    if (!workflow.workflow_parameters()) {
        return params_struct;
    }

    auto& fields = *params_struct.mutable_fields();
    for (const auto& parameter : *workflow.workflow_parameters()) {
        const std::string& key = key_name(parameter);
        auto it = params_dict.find(key);
        if (it == params_dict.end()) {
            throw MissingFieldException("Param with key \"" + key + "\" is missing in params_dict.");
        }
        fields[key] = to_pb_value(parameter, it->second);
    }
    return params_struct;
}

} // namespace omotes
