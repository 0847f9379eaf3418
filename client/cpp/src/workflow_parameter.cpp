#include "omotes/workflow_parameter.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <type_traits>
#include "omotes/logging.hpp"

namespace omotes {

namespace {

struct BaseFields {
    std::string key_name;
    std::optional<std::string> title;
    std::optional<std::string> description;
};

std::string display(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

const char* kind_name(const google::protobuf::Value& value) {
    switch (value.kind_case()) {
        case google::protobuf::Value::kNullValue: return "null";
        case google::protobuf::Value::kNumberValue: return "number";
        case google::protobuf::Value::kStringValue: return "string";
        case google::protobuf::Value::kBoolValue: return "bool";
        case google::protobuf::Value::kStructValue: return "struct";
        case google::protobuf::Value::kListValue: return "list";
        default: return "unset";
    }
}

std::string describe(const google::protobuf::Value& value) {
    switch (value.kind_case()) {
        case google::protobuf::Value::kNumberValue: {
            std::ostringstream out;
            out << value.number_value();
            return out.str();
        }
        case google::protobuf::Value::kStringValue: return value.string_value();
        case google::protobuf::Value::kBoolValue: return value.bool_value() ? "true" : "false";
        default: return kind_name(value);
    }
}

const char* alternative_name(const ParamValue& value) {
    static const char* names[] = {"string", "bool", "int", "float", "datetime"};
    return names[value.index()];
}

std::string describe(const ParamValue& value) {
    std::ostringstream out;
    if (auto* s = std::get_if<std::string>(&value)) out << *s;
    else if (auto* b = std::get_if<bool>(&value)) out << (*b ? "true" : "false");
    else if (auto* i = std::get_if<int64_t>(&value)) out << *i;
    else if (auto* d = std::get_if<double>(&value)) out << *d;
    else out << helpers::format_iso8601(std::get<DateTime>(value));
    return out.str();
}

WrongFieldTypeException from_pb_error(const google::protobuf::Value& value, const char* expected) {
    return WrongFieldTypeException("Cannot convert value \"" + describe(value) +
                                   "\" from a PB value as the type is " + kind_name(value) +
                                   " while " + expected + " was expected.");
}

WrongFieldTypeException to_pb_error(const ParamValue& value, const char* expected) {
    return WrongFieldTypeException("Cannot convert value \"" + describe(value) +
                                   "\" to a PB-compatible value as the type is " +
                                   alternative_name(value) + " while " + expected +
                                   " was expected.");
}

google::protobuf::Value number_value(double value) {
    google::protobuf::Value result;
    result.set_number_value(value);
    return result;
}

BaseFields parse_base_fields(const nlohmann::json& json_config, const std::string& class_name,
                             std::initializer_list<const char*> extra_keys) {
    if (!json_config.is_object()) {
        throw WrongFieldTypeException("Configuration for " + class_name + " must be an object: '" +
                                      display(json_config) + "'");
    }

    for (const auto& item : json_config.items()) {
        const std::string& key = item.key();
        bool known = key == "key_name" || key == "title" || key == "description" ||
                     std::any_of(extra_keys.begin(), extra_keys.end(),
                                 [&key](const char* extra) { return key == extra; });
        if (!known) {
            throw InvalidArgumentError("Unknown field '" + key + "' for " + class_name);
        }
    }

    BaseFields fields;
    auto key_it = json_config.find("key_name");
    if (key_it == json_config.end()) {
        throw MissingFieldException("'key_name' is missing for " + class_name);
    }
    if (!key_it->is_string()) {
        throw WrongFieldTypeException("'key_name' for " + class_name + " must be in 'str' format: '" +
                                      display(*key_it) + "'");
    }
    fields.key_name = key_it->get<std::string>();

    for (const char* optional_key : {"title", "description"}) {
        auto it = json_config.find(optional_key);
        if (it == json_config.end()) continue;
        if (!it->is_string()) {
            throw WrongFieldTypeException(std::string("'") + optional_key + "' for " + class_name +
                                          " must be in 'str' format: '" + display(*it) + "'");
        }
        if (std::string(optional_key) == "title") {
            fields.title = it->get<std::string>();
        } else {
            fields.description = it->get<std::string>();
        }
    }
    return fields;
}

BaseFields base_fields_from_pb(const protocol::WorkflowParameter& parameter_pb) {
    BaseFields fields;
    fields.key_name = parameter_pb.key_name();
    if (parameter_pb.has_title()) fields.title = parameter_pb.title();
    if (parameter_pb.has_description()) fields.description = parameter_pb.description();
    return fields;
}

template<typename P>
void assign_base(P& parameter, BaseFields&& fields) {
    parameter.key_name = std::move(fields.key_name);
    parameter.title = std::move(fields.title);
    parameter.description = std::move(fields.description);
}

template<typename T, typename Check>
std::optional<T> optional_json_field(const nlohmann::json& json_config, const char* key,
                                     const std::string& class_name, const char* format,
                                     Check check) {
    auto it = json_config.find(key);
    if (it == json_config.end()) {
        return std::nullopt;
    }
    if (!check(*it)) {
        throw WrongFieldTypeException(std::string("'") + key + "' for " + class_name +
                                      " must be in '" + format + "' format: '" + display(*it) + "'");
    }
    return it->get<T>();
}

// -----------------------------------------------------------------------------
// Tag table
// -----------------------------------------------------------------------------

using JsonFactory = WorkflowParameter (*)(const nlohmann::json&);
using PbFactory = WorkflowParameter (*)(const protocol::WorkflowParameter&);

struct ParameterFactory {
    JsonFactory from_json;
    PbFactory from_pb;
};

template<typename P>
WorkflowParameter parameter_from_json(const nlohmann::json& json_config) {
    return P::from_json_config(json_config);
}

WorkflowParameter string_from_pb(const protocol::WorkflowParameter& pb) {
    return StringParameter::from_pb_message(pb, pb.string_parameter());
}

WorkflowParameter boolean_from_pb(const protocol::WorkflowParameter& pb) {
    return BooleanParameter::from_pb_message(pb, pb.boolean_parameter());
}

WorkflowParameter integer_from_pb(const protocol::WorkflowParameter& pb) {
    return IntegerParameter::from_pb_message(pb, pb.integer_parameter());
}

WorkflowParameter float_from_pb(const protocol::WorkflowParameter& pb) {
    return FloatParameter::from_pb_message(pb, pb.float_parameter());
}

WorkflowParameter datetime_from_pb(const protocol::WorkflowParameter& pb) {
    return DateTimeParameter::from_pb_message(pb, pb.datetime_parameter());
}

constexpr size_t kParameterKinds = std::variant_size_v<WorkflowParameter>;

const std::array<ParameterTypeInfo, kParameterKinds> kParameterTypes{{
    {StringParameter::kTypeName, protocol::WorkflowParameter::kStringParameter},
    {BooleanParameter::kTypeName, protocol::WorkflowParameter::kBooleanParameter},
    {IntegerParameter::kTypeName, protocol::WorkflowParameter::kIntegerParameter},
    {FloatParameter::kTypeName, protocol::WorkflowParameter::kFloatParameter},
    {DateTimeParameter::kTypeName, protocol::WorkflowParameter::kDatetimeParameter},
}};

const std::array<ParameterFactory, kParameterKinds> kParameterFactories{{
    {parameter_from_json<StringParameter>, string_from_pb},
    {parameter_from_json<BooleanParameter>, boolean_from_pb},
    {parameter_from_json<IntegerParameter>, integer_from_pb},
    {parameter_from_json<FloatParameter>, float_from_pb},
    {parameter_from_json<DateTimeParameter>, datetime_from_pb},
}};

} // namespace

// =============================================================================
// StringParameter
// =============================================================================

StringParameter StringParameter::from_json_config(const nlohmann::json& json_config) {
    const std::string class_name = "StringParameter";
    StringParameter parameter;
    assign_base(parameter, parse_base_fields(json_config, class_name, {"default", "enum_options"}));

    auto default_it = json_config.find("default");
    if (default_it != json_config.end()) {
        if (!default_it->is_string()) {
            throw WrongFieldTypeException("'default' for StringParameter must be in 'str' format");
        }
        parameter.default_value = default_it->get<std::string>();
    }

    auto options_it = json_config.find("enum_options");
    if (options_it != json_config.end()) {
        if (!options_it->is_array()) {
            throw WrongFieldTypeException("'enum_options' for StringParameter must be a 'list'");
        }
        std::vector<StringEnumOption> options;
        for (const auto& option : *options_it) {
            if (!option.is_object()) {
                throw WrongFieldTypeException("A string enum option must be an object: '" +
                                              display(option) + "'");
            }
            for (const char* enum_key : {"key_name", "display_name"}) {
                auto it = option.find(enum_key);
                if (it == option.end()) {
                    throw WrongFieldTypeException(
                        std::string("A string enum option must contain a '") + enum_key + "'");
                }
                if (!it->is_string()) {
                    throw WrongFieldTypeException(std::string("'") + enum_key +
                                                  "' for a string enum option must be in 'str' format: '" +
                                                  display(*it) + "'");
                }
            }
            options.push_back({option["key_name"].get<std::string>(),
                               option["display_name"].get<std::string>()});
        }
        parameter.enum_options = std::move(options);
    }
    return parameter;
}

protocol::StringParameter StringParameter::to_pb_message() const {
    protocol::StringParameter parameter_type_pb;
    if (default_value) {
        parameter_type_pb.set_default_value(*default_value);
    }
    if (enum_options) {
        for (const auto& option : *enum_options) {
            auto* option_pb = parameter_type_pb.add_enum_options();
            option_pb->set_key_name(option.key_name);
            option_pb->set_display_name(option.display_name);
        }
    }
    return parameter_type_pb;
}

StringParameter StringParameter::from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                                 const protocol::StringParameter& parameter_type_pb) {
    StringParameter parameter;
    assign_base(parameter, base_fields_from_pb(parameter_pb));
    if (parameter_type_pb.has_default_value()) {
        parameter.default_value = parameter_type_pb.default_value();
    }
    if (parameter_type_pb.enum_options_size() > 0) {
        std::vector<StringEnumOption> options;
        options.reserve(parameter_type_pb.enum_options_size());
        for (const auto& option_pb : parameter_type_pb.enum_options()) {
            options.push_back({option_pb.key_name(), option_pb.display_name()});
        }
        parameter.enum_options = std::move(options);
    }
    return parameter;
}

std::string StringParameter::from_pb_value(const google::protobuf::Value& value) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
        throw from_pb_error(value, "a string");
    }
    return value.string_value();
}

google::protobuf::Value StringParameter::to_pb_value(const ParamValue& value) {
    const auto* text = std::get_if<std::string>(&value);
    if (!text) {
        throw to_pb_error(value, "a string");
    }
    google::protobuf::Value result;
    result.set_string_value(*text);
    return result;
}

// =============================================================================
// BooleanParameter
// =============================================================================

BooleanParameter BooleanParameter::from_json_config(const nlohmann::json& json_config) {
    const std::string class_name = "BooleanParameter";
    BooleanParameter parameter;
    assign_base(parameter, parse_base_fields(json_config, class_name, {"default"}));
    parameter.default_value = optional_json_field<bool>(
        json_config, "default", class_name, "bool",
        [](const nlohmann::json& v) { return v.is_boolean(); });
    return parameter;
}

protocol::BooleanParameter BooleanParameter::to_pb_message() const {
    protocol::BooleanParameter parameter_type_pb;
    if (default_value) {
        parameter_type_pb.set_default_value(*default_value);
    }
    return parameter_type_pb;
}

BooleanParameter BooleanParameter::from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                                   const protocol::BooleanParameter& parameter_type_pb) {
    BooleanParameter parameter;
    assign_base(parameter, base_fields_from_pb(parameter_pb));
    if (parameter_type_pb.has_default_value()) {
        parameter.default_value = parameter_type_pb.default_value();
    }
    return parameter;
}

bool BooleanParameter::from_pb_value(const google::protobuf::Value& value) {
    if (value.kind_case() != google::protobuf::Value::kBoolValue) {
        throw from_pb_error(value, "a bool");
    }
    return value.bool_value();
}

google::protobuf::Value BooleanParameter::to_pb_value(const ParamValue& value) {
    const auto* flag = std::get_if<bool>(&value);
    if (!flag) {
        throw to_pb_error(value, "a bool");
    }
    google::protobuf::Value result;
    result.set_bool_value(*flag);
    return result;
}

// =============================================================================
// IntegerParameter
// =============================================================================

IntegerParameter IntegerParameter::from_json_config(const nlohmann::json& json_config) {
    const std::string class_name = "IntegerParameter";
    IntegerParameter parameter;
    assign_base(parameter, parse_base_fields(json_config, class_name, {"default", "minimum", "maximum"}));

    auto is_int = [](const nlohmann::json& v) { return v.is_number_integer(); };
    parameter.default_value = optional_json_field<int64_t>(json_config, "default", class_name, "int", is_int);
    parameter.minimum = optional_json_field<int64_t>(json_config, "minimum", class_name, "int", is_int);
    parameter.maximum = optional_json_field<int64_t>(json_config, "maximum", class_name, "int", is_int);
    return parameter;
}

protocol::IntegerParameter IntegerParameter::to_pb_message() const {
    protocol::IntegerParameter parameter_type_pb;
    if (default_value) parameter_type_pb.set_default_value(*default_value);
    if (minimum) parameter_type_pb.set_minimum(*minimum);
    if (maximum) parameter_type_pb.set_maximum(*maximum);
    return parameter_type_pb;
}

IntegerParameter IntegerParameter::from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                                   const protocol::IntegerParameter& parameter_type_pb) {
    IntegerParameter parameter;
    assign_base(parameter, base_fields_from_pb(parameter_pb));
    // Zero is a meaningful bound, so presence is read from has_*() only.
    if (parameter_type_pb.has_default_value()) parameter.default_value = parameter_type_pb.default_value();
    if (parameter_type_pb.has_minimum()) parameter.minimum = parameter_type_pb.minimum();
    if (parameter_type_pb.has_maximum()) parameter.maximum = parameter_type_pb.maximum();
    return parameter;
}

int64_t IntegerParameter::from_pb_value(const google::protobuf::Value& value) {
    if (value.kind_case() != google::protobuf::Value::kNumberValue) {
        throw from_pb_error(value, "an int or float");
    }

    double number = value.number_value();
    double rounded = std::nearbyint(number);
    if (!std::isfinite(rounded) ||
        rounded < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
        rounded >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        throw from_pb_error(value, "an int within range");
    }

    auto result = static_cast<int64_t>(rounded);
    if (rounded != number) {
        log_warning(log_domains::SDK,
                    "A field was passed in workflow configuration but as a float value with decimal "
                    "instead of a rounded float. Rounding the field value.",
                    {{"value", number}, {"rounded", result}});
    }
    return result;
}

google::protobuf::Value IntegerParameter::to_pb_value(const ParamValue& value) {
    const auto* integer = std::get_if<int64_t>(&value);
    if (!integer) {
        throw to_pb_error(value, "an int");
    }
    return number_value(static_cast<double>(*integer));
}

// =============================================================================
// FloatParameter
// =============================================================================

FloatParameter FloatParameter::from_json_config(const nlohmann::json& json_config) {
    const std::string class_name = "FloatParameter";
    FloatParameter parameter;
    assign_base(parameter, parse_base_fields(json_config, class_name, {"default", "minimum", "maximum"}));

    auto is_number = [](const nlohmann::json& v) { return v.is_number(); };
    parameter.default_value = optional_json_field<double>(json_config, "default", class_name, "float", is_number);
    parameter.minimum = optional_json_field<double>(json_config, "minimum", class_name, "float", is_number);
    parameter.maximum = optional_json_field<double>(json_config, "maximum", class_name, "float", is_number);
    return parameter;
}

protocol::FloatParameter FloatParameter::to_pb_message() const {
    protocol::FloatParameter parameter_type_pb;
    if (default_value) parameter_type_pb.set_default_value(*default_value);
    if (minimum) parameter_type_pb.set_minimum(*minimum);
    if (maximum) parameter_type_pb.set_maximum(*maximum);
    return parameter_type_pb;
}

FloatParameter FloatParameter::from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                               const protocol::FloatParameter& parameter_type_pb) {
    FloatParameter parameter;
    assign_base(parameter, base_fields_from_pb(parameter_pb));
    if (parameter_type_pb.has_default_value()) parameter.default_value = parameter_type_pb.default_value();
    if (parameter_type_pb.has_minimum()) parameter.minimum = parameter_type_pb.minimum();
    if (parameter_type_pb.has_maximum()) parameter.maximum = parameter_type_pb.maximum();
    return parameter;
}

double FloatParameter::from_pb_value(const google::protobuf::Value& value) {
    if (value.kind_case() != google::protobuf::Value::kNumberValue) {
        throw from_pb_error(value, "a float");
    }
    return value.number_value();
}

google::protobuf::Value FloatParameter::to_pb_value(const ParamValue& value) {
    const auto* number = std::get_if<double>(&value);
    if (!number) {
        throw to_pb_error(value, "a float");
    }
    return number_value(*number);
}

// =============================================================================
// DateTimeParameter
// =============================================================================

DateTimeParameter DateTimeParameter::from_json_config(const nlohmann::json& json_config) {
    const std::string class_name = "DateTimeParameter";
    DateTimeParameter parameter;
    assign_base(parameter, parse_base_fields(json_config, class_name, {"default"}));

    auto default_it = json_config.find("default");
    if (default_it != json_config.end()) {
        if (!default_it->is_string()) {
            throw InvalidTimestampError(
                "Invalid default datetime format, should be a string in ISO format: '" +
                display(*default_it) + "'");
        }
        parameter.default_value = helpers::parse_iso8601(default_it->get<std::string>());
    }
    return parameter;
}

protocol::DateTimeParameter DateTimeParameter::to_pb_message() const {
    protocol::DateTimeParameter parameter_type_pb;
    if (default_value) {
        parameter_type_pb.set_default_value(helpers::format_iso8601(*default_value));
    }
    return parameter_type_pb;
}

DateTimeParameter DateTimeParameter::from_pb_message(const protocol::WorkflowParameter& parameter_pb,
                                                     const protocol::DateTimeParameter& parameter_type_pb) {
    DateTimeParameter parameter;
    assign_base(parameter, base_fields_from_pb(parameter_pb));
    if (parameter_type_pb.has_default_value()) {
        parameter.default_value = helpers::parse_iso8601(parameter_type_pb.default_value());
    }
    return parameter;
}

DateTime DateTimeParameter::from_pb_value(const google::protobuf::Value& value) {
    if (value.kind_case() != google::protobuf::Value::kNumberValue) {
        throw from_pb_error(value, "a float");
    }
    return helpers::from_timestamp(value.number_value());
}

google::protobuf::Value DateTimeParameter::to_pb_value(const ParamValue& value) {
    const auto* moment = std::get_if<DateTime>(&value);
    if (!moment) {
        throw to_pb_error(value, "a datetime");
    }
    return number_value(helpers::to_timestamp(*moment));
}

// =============================================================================
// Variant dispatch
// =============================================================================

const std::array<ParameterTypeInfo, std::variant_size_v<WorkflowParameter>>& parameter_type_table() {
    return kParameterTypes;
}

const std::string& key_name(const WorkflowParameter& parameter) {
    return std::visit([](const auto& p) -> const std::string& { return p.key_name; }, parameter);
}

const char* type_name(const WorkflowParameter& parameter) {
    return kParameterTypes[parameter.index()].type_name;
}

std::optional<WorkflowParameter> workflow_parameter_from_json_config(
    const std::string& parameter_type, const nlohmann::json& json_config) {
    for (size_t i = 0; i < kParameterKinds; ++i) {
        if (parameter_type == kParameterTypes[i].type_name) {
            return kParameterFactories[i].from_json(json_config);
        }
    }
    return std::nullopt;
}

protocol::WorkflowParameter workflow_parameter_to_pb_message(const WorkflowParameter& parameter) {
    return std::visit([](const auto& p) {
        using P = std::decay_t<decltype(p)>;

        protocol::WorkflowParameter parameter_pb;
        parameter_pb.set_key_name(p.key_name);
        if (p.title) parameter_pb.set_title(*p.title);
        if (p.description) parameter_pb.set_description(*p.description);

        if constexpr (std::is_same_v<P, StringParameter>) {
            *parameter_pb.mutable_string_parameter() = p.to_pb_message();
        } else if constexpr (std::is_same_v<P, BooleanParameter>) {
            *parameter_pb.mutable_boolean_parameter() = p.to_pb_message();
        } else if constexpr (std::is_same_v<P, IntegerParameter>) {
            *parameter_pb.mutable_integer_parameter() = p.to_pb_message();
        } else if constexpr (std::is_same_v<P, FloatParameter>) {
            *parameter_pb.mutable_float_parameter() = p.to_pb_message();
        } else {
            static_assert(std::is_same_v<P, DateTimeParameter>, "unhandled parameter kind");
            *parameter_pb.mutable_datetime_parameter() = p.to_pb_message();
        }
        return parameter_pb;
    }, parameter);
}

WorkflowParameter workflow_parameter_from_pb_message(const protocol::WorkflowParameter& parameter_pb) {
    const auto pb_case = parameter_pb.parameter_type_case();
    for (size_t i = 0; i < kParameterKinds; ++i) {
        if (kParameterTypes[i].pb_case == pb_case) {
            return kParameterFactories[i].from_pb(parameter_pb);
        }
    }
    throw InvalidArgumentError("Parameter protobuf message with invalid type: '" +
                               parameter_pb.key_name() + "'");
}

google::protobuf::Value to_pb_value(const WorkflowParameter& parameter, const ParamValue& value) {
    return std::visit([&value](const auto& p) {
        return std::decay_t<decltype(p)>::to_pb_value(value);
    }, parameter);
}

ParamValue from_pb_value(const WorkflowParameter& parameter, const google::protobuf::Value& value) {
    return std::visit([&value](const auto& p) -> ParamValue {
        return std::decay_t<decltype(p)>::from_pb_value(value);
    }, parameter);
}

} // namespace omotes
