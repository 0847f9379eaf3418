#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <google/protobuf/struct.pb.h>
#include <nlohmann/json.hpp>
#include "omotes/workflow.pb.h"
#include "errors.hpp"
#include "helpers.hpp"

namespace omotes {

/**
 * A value for a workflow parameter as handled by application code.
 *
 * Each parameter kind accepts exactly one alternative: string, bool,
 * int64_t, double or DateTime respectively.
 */
using ParamValue = std::variant<std::string, bool, int64_t, double, DateTime>;

/**
 * Key/display pair for a multiple-choice string parameter.
 */
struct StringEnumOption {
    std::string key_name;
    std::string display_name;

    bool operator==(const StringEnumOption& other) const {
        return key_name == other.key_name && display_name == other.display_name;
    }
    bool operator!=(const StringEnumOption& other) const { return !(*this == other); }
};

/**
 * Free-text or multiple-choice string parameter.
 *
 * Two parameters of the same kind compare equal when their key names match;
 * title, description, default and constraints are display metadata.
 */
struct StringParameter {
    using ValueType = std::string;
    static constexpr const char* kTypeName = "string";

    std::string key_name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> default_value;
    std::optional<std::vector<StringEnumOption>> enum_options;

    /**
     * Validate a JSON parameter definition.
     *
     * @throws MissingFieldException if "key_name" is absent
     * @throws WrongFieldTypeException if a field has the wrong JSON type or an
     *         enum option lacks "key_name"/"display_name"
     * @throws InvalidArgumentError on unknown fields
     */
    static StringParameter from_json_config(const nlohmann::json& json_config);

    protocol::StringParameter to_pb_message() const;

    static StringParameter from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                           const protocol::StringParameter& parameter_type_pb);

    static ValueType from_pb_value(const google::protobuf::Value& value);
    static google::protobuf::Value to_pb_value(const ParamValue& value);

    bool operator==(const StringParameter& other) const { return key_name == other.key_name; }
    bool operator!=(const StringParameter& other) const { return !(*this == other); }
};

struct BooleanParameter {
    using ValueType = bool;
    static constexpr const char* kTypeName = "boolean";

    std::string key_name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<bool> default_value;

    static BooleanParameter from_json_config(const nlohmann::json& json_config);

    protocol::BooleanParameter to_pb_message() const;

    static BooleanParameter from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                            const protocol::BooleanParameter& parameter_type_pb);

    static ValueType from_pb_value(const google::protobuf::Value& value);
    static google::protobuf::Value to_pb_value(const ParamValue& value);

    bool operator==(const BooleanParameter& other) const { return key_name == other.key_name; }
    bool operator!=(const BooleanParameter& other) const { return !(*this == other); }
};

struct IntegerParameter {
    using ValueType = int64_t;
    static constexpr const char* kTypeName = "integer";

    std::string key_name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<int64_t> default_value;
    std::optional<int64_t> minimum;
    std::optional<int64_t> maximum;

    static IntegerParameter from_json_config(const nlohmann::json& json_config);

    protocol::IntegerParameter to_pb_message() const;

    static IntegerParameter from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                            const protocol::IntegerParameter& parameter_type_pb);

    /**
     * Wire numbers are doubles. A value with a fractional part is rounded to
     * the nearest integer (ties to even) and a warning is logged.
     *
     * @throws WrongFieldTypeException if the value is not a number
     */
    static ValueType from_pb_value(const google::protobuf::Value& value);
    static google::protobuf::Value to_pb_value(const ParamValue& value);

    bool operator==(const IntegerParameter& other) const { return key_name == other.key_name; }
    bool operator!=(const IntegerParameter& other) const { return !(*this == other); }
};

struct FloatParameter {
    using ValueType = double;
    static constexpr const char* kTypeName = "float";

    std::string key_name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<double> default_value;
    std::optional<double> minimum;
    std::optional<double> maximum;

    static FloatParameter from_json_config(const nlohmann::json& json_config);

    protocol::FloatParameter to_pb_message() const;

    static FloatParameter from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                          const protocol::FloatParameter& parameter_type_pb);

    static ValueType from_pb_value(const google::protobuf::Value& value);
    static google::protobuf::Value to_pb_value(const ParamValue& value);

    bool operator==(const FloatParameter& other) const { return key_name == other.key_name; }
    bool operator!=(const FloatParameter& other) const { return !(*this == other); }
};

/**
 * Datetime parameter. On the wire a value is a Unix timestamp in seconds;
 * the default in a workflow definition is an ISO 8601 string.
 */
struct DateTimeParameter {
    using ValueType = DateTime;
    static constexpr const char* kTypeName = "datetime";

    std::string key_name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<DateTime> default_value;

    /**
     * @throws InvalidTimestampError if "default" is not an ISO 8601 string
     */
    static DateTimeParameter from_json_config(const nlohmann::json& json_config);

    protocol::DateTimeParameter to_pb_message() const;

    static DateTimeParameter from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                             const protocol::DateTimeParameter& parameter_type_pb);

    /**
     * @throws WrongFieldTypeException if the value is not a number
     * @throws InvalidTimestampError if the seconds lie outside years 0001-9999
     */
    static ValueType from_pb_value(const google::protobuf::Value& value);
    static google::protobuf::Value to_pb_value(const ParamValue& value);

    bool operator==(const DateTimeParameter& other) const { return key_name == other.key_name; }
    bool operator!=(const DateTimeParameter& other) const { return !(*this == other); }
};

/**
 * The closed set of parameter kinds a workflow may declare.
 */
using WorkflowParameter = std::variant<
    StringParameter,
    BooleanParameter,
    IntegerParameter,
    FloatParameter,
    DateTimeParameter>;

/**
 * Static description of one parameter kind, indexed by variant index.
 */
struct ParameterTypeInfo {
    const char* type_name;
    protocol::WorkflowParameter::ParameterTypeCase pb_case;
};

/**
 * Tag table: entry i describes std::variant_alternative_t<i, WorkflowParameter>.
 */
const std::array<ParameterTypeInfo, std::variant_size_v<WorkflowParameter>>& parameter_type_table();

const std::string& key_name(const WorkflowParameter& parameter);

const char* type_name(const WorkflowParameter& parameter);

/**
 * Build a parameter from its JSON definition given the "parameter_type"
 * discriminator.
 *
 * @return std::nullopt if the discriminator names no known parameter kind
 */
std::optional<WorkflowParameter> workflow_parameter_from_json_config(
    const std::string& parameter_type, const nlohmann::json& json_config);

/**
 * Serialize a parameter including its key name, title, description and the
 * populated parameter_type oneof.
 */
protocol::WorkflowParameter workflow_parameter_to_pb_message(const WorkflowParameter& parameter);

/**
 * @throws InvalidArgumentError if the parameter_type oneof is not set
 * @throws InvalidTimestampError if a datetime default is malformed
 */
WorkflowParameter workflow_parameter_from_pb_message(const protocol::WorkflowParameter& parameter_pb);

/**
 * Convert a runtime value through the parameter's kind.
 *
 * @throws WrongFieldTypeException if the value holds the wrong alternative
 */
google::protobuf::Value to_pb_value(const WorkflowParameter& parameter, const ParamValue& value);

ParamValue from_pb_value(const WorkflowParameter& parameter, const google::protobuf::Value& value);

} // namespace omotes
