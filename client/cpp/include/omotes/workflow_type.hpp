#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <google/protobuf/struct.pb.h>
#include <nlohmann/json.hpp>
#include "omotes/workflow.pb.h"
#include "errors.hpp"
#include "logging.hpp"
#include "workflow_parameter.hpp"

namespace omotes {

/**
 * Runtime parameter values for one job, keyed by parameter key name.
 */
using ParamsDict = std::map<std::string, ParamValue>;

/**
 * A type of workflow the orchestrator can run.
 *
 * Identity is the technical name only: it is used for equality, hashing and
 * for naming the submission queue.
 */
class WorkflowType {
public:
    WorkflowType(std::string workflow_type_name,
                 std::string workflow_type_description_name,
                 std::optional<std::vector<WorkflowParameter>> workflow_parameters = std::nullopt)
        : workflow_type_name_(std::move(workflow_type_name)),
          workflow_type_description_name_(std::move(workflow_type_description_name)),
          workflow_parameters_(std::move(workflow_parameters)) {}

    const std::string& workflow_type_name() const { return workflow_type_name_; }

    const std::string& workflow_type_description_name() const {
        return workflow_type_description_name_;
    }

    const std::optional<std::vector<WorkflowParameter>>& workflow_parameters() const {
        return workflow_parameters_;
    }

    bool operator==(const WorkflowType& other) const {
        return workflow_type_name_ == other.workflow_type_name_;
    }
    bool operator!=(const WorkflowType& other) const { return !(*this == other); }

private:
    std::string workflow_type_name_;
    std::string workflow_type_description_name_;
    std::optional<std::vector<WorkflowParameter>> workflow_parameters_;
};

/**
 * Registry of all workflows known to one side of the protocol.
 *
 * Built once, from the JSON configuration on the orchestrator or from a
 * received AvailableWorkflows message on the client, and read-only after.
 */
class WorkflowTypeManager {
public:
    WorkflowTypeManager() = default;

    /**
     * Later entries with a name already present replace the earlier entry in
     * place.
     */
    explicit WorkflowTypeManager(std::vector<WorkflowType> possible_workflows);

    /**
     * Load workflows from a JSON configuration file.
     *
     * @param json_config_file_path Path to a JSON array of workflow definitions
     * @throws ConfigError if the file cannot be read or is not valid JSON
     * @throws MissingFieldException if a workflow lacks a required key
     */
    static WorkflowTypeManager from_json_config_file(const std::string& json_config_file_path);

    /**
     * Build from an already parsed JSON array.
     *
     * Parameters with an unknown "parameter_type" are skipped with a warning.
     */
    static WorkflowTypeManager from_json_config(const nlohmann::json& json_config);

    /**
     * @throws InvalidArgumentError if a parameter message has no type set
     */
    static WorkflowTypeManager from_pb_message(const protocol::AvailableWorkflows& available_workflows_pb);

    protocol::AvailableWorkflows to_pb_message() const;

    /**
     * @return The workflow, or nullptr if no workflow has this name
     */
    const WorkflowType* get_workflow_by_name(const std::string& name) const;

    /**
     * All workflows, in the order they were registered.
     */
    std::vector<WorkflowType> get_all_workflows() const;

    bool workflow_exists(const WorkflowType& workflow) const;

    size_t size() const { return order_.size(); }

private:
    std::unordered_map<std::string, WorkflowType> workflows_;
    std::vector<std::string> order_;
};

/**
 * Convert runtime parameter values into their wire Struct.
 *
 * Every parameter declared by the workflow is converted through its kind;
 * keys the workflow does not declare are ignored.
 *
 * @throws MissingFieldException if a declared parameter has no value
 * @throws WrongFieldTypeException if a value has the wrong kind
 */
google::protobuf::Struct convert_params_dict_to_struct(const WorkflowType& workflow,
                                                       const ParamsDict& params_dict);

/**
 * Extract one typed parameter from a received workflow configuration.
 *
 * A present, convertible value is returned as is. A value of the wrong kind
 * or a missing key falls back to default_value when one is given (logged as a
 * warning); otherwise the failure is logged as an error and thrown.
 *
 * @tparam P One of the parameter kinds, e.g. IntegerParameter
 * @throws WrongFieldTypeException if the value has the wrong kind and no default is given
 * @throws MissingFieldException if the key is absent and no default is given
 */
template<typename P>
typename P::ValueType parse_workflow_config_parameter(
    const google::protobuf::Struct& workflow_config,
    const std::string& field_key,
    const std::optional<typename P::ValueType>& default_value = std::nullopt) {
    const auto& fields = workflow_config.fields();
    auto it = fields.find(field_key);

    if (it == fields.end()) {
        if (default_value) {
            log_warning(log_domains::SDK,
                        field_key + " field was missing in workflow configuration. Using default value",
                        {{"field", field_key}, {"parameter_type", P::kTypeName}});
            return *default_value;
        }
        log_error(log_domains::SDK,
                  field_key + " field was missing in workflow configuration. No default available.",
                  {{"field", field_key}, {"parameter_type", P::kTypeName}});
        throw MissingFieldException("Field '" + field_key + "' is missing in workflow configuration");
    }

    try {
        return P::from_pb_value(it->second);
    } catch (const WrongFieldTypeException& e) {
        if (default_value) {
            log_warning(log_domains::SDK,
                        field_key + " field was passed in workflow configuration with the wrong type. "
                        "Using default value",
                        {{"field", field_key}, {"parameter_type", P::kTypeName}, {"error", e.what()}});
            return *default_value;
        }
        log_error(log_domains::SDK,
                  field_key + " field was passed in workflow configuration with the wrong type. "
                  "No default available.",
                  {{"field", field_key}, {"parameter_type", P::kTypeName}, {"error", e.what()}});
        throw;
    }
}

} // namespace omotes

namespace std {

template<>
struct hash<omotes::WorkflowType> {
    size_t operator()(const omotes::WorkflowType& workflow) const {
        return hash<string>()(workflow.workflow_type_name());
    }
};

} // namespace std
