#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <unordered_set>
#include "omotes/workflow_type.hpp"
#include "log_capture.hpp"

using namespace omotes;

namespace {

std::string config_path(const std::string& file_name) {
    return std::string(OMOTES_TEST_CONFIG_DIR) + "/" + file_name;
}

google::protobuf::Struct make_config(const std::string& key, const google::protobuf::Value& value) {
    google::protobuf::Struct config;
    (*config.mutable_fields())[key] = value;
    return config;
}

google::protobuf::Value string_value(const std::string& value) {
    google::protobuf::Value result;
    result.set_string_value(value);
    return result;
}

} // namespace

// =============================================================================
// WorkflowType Identity Tests
// =============================================================================

TEST(WorkflowTypeTest, SameNameDifferentDescription_ShouldBeEqual) {
    WorkflowType first("some-workflow", "some description");
    WorkflowType second("some-workflow", "some other description");

    EXPECT_TRUE(first == second);
}

TEST(WorkflowTypeTest, DifferentNameSameDescription_ShouldNotBeEqual) {
    WorkflowType first("some-workflow", "some description");
    WorkflowType second("some-other-workflow", "some description");

    EXPECT_FALSE(first == second);
}

TEST(WorkflowTypeTest, SameNameDifferentDescription_ShouldHaveSameHash) {
    std::hash<WorkflowType> hasher;

    EXPECT_EQ(hasher(WorkflowType("some-workflow", "a")), hasher(WorkflowType("some-workflow", "b")));
}

TEST(WorkflowTypeTest, DifferentName_ShouldHaveDifferentHash) {
    std::hash<WorkflowType> hasher;

    EXPECT_NE(hasher(WorkflowType("some-workflow", "a")), hasher(WorkflowType("some-other-workflow", "a")));
}

TEST(WorkflowTypeTest, UnorderedSet_ShouldDeduplicateByName) {
    std::unordered_set<WorkflowType> workflows;
    workflows.insert(WorkflowType("grow_optimizer", "Optimizer"));
    workflows.insert(WorkflowType("grow_optimizer", "Optimizer v2"));

    EXPECT_EQ(workflows.size(), 1u);
}

// =============================================================================
// WorkflowTypeManager JSON Configuration Tests
// =============================================================================

TEST(WorkflowTypeManagerTest, FromJsonConfigFile_Happy_ShouldLoadAllWorkflows) {
    // Given the happy configuration file
    // When I load it
    auto manager = WorkflowTypeManager::from_json_config_file(config_path("workflow_config_happy.json"));

    // Then both workflows should be available in file order
    auto workflows = manager.get_all_workflows();
    ASSERT_EQ(workflows.size(), 2u);
    EXPECT_EQ(workflows[0].workflow_type_name(), "workflow_1");
    EXPECT_EQ(workflows[1].workflow_type_name(), "workflow_2");
    ASSERT_TRUE(workflows[0].workflow_parameters().has_value());
    EXPECT_EQ(workflows[0].workflow_parameters()->size(), 6u);
    EXPECT_FALSE(workflows[1].workflow_parameters().has_value());
}

TEST(WorkflowTypeManagerTest, FromJsonConfigFile_IntegerMinimumAsFloat_ShouldThrowWrongFieldType) {
    try {
        WorkflowTypeManager::from_json_config_file(config_path("workflow_config_int_min_as_float.json"));
        FAIL() << "Expected WrongFieldTypeException";
    } catch (const WrongFieldTypeException& e) {
        EXPECT_EQ(std::string(e.what()), "'minimum' for IntegerParameter must be in 'int' format: '1.5'");
    }
}

TEST(WorkflowTypeManagerTest, FromJsonConfigFile_EnumOptionMissingKey_ShouldThrowWrongFieldType) {
    try {
        WorkflowTypeManager::from_json_config_file(config_path("workflow_config_enum_option_missing_key.json"));
        FAIL() << "Expected WrongFieldTypeException";
    } catch (const WrongFieldTypeException& e) {
        EXPECT_EQ(std::string(e.what()), "A string enum option must contain a 'display_name'");
    }
}

TEST(WorkflowTypeManagerTest, FromJsonConfigFile_EnumOptionsNotAsList_ShouldThrowWrongFieldType) {
    try {
        WorkflowTypeManager::from_json_config_file(config_path("workflow_config_enum_options_not_as_list.json"));
        FAIL() << "Expected WrongFieldTypeException";
    } catch (const WrongFieldTypeException& e) {
        EXPECT_EQ(std::string(e.what()), "'enum_options' for StringParameter must be a 'list'");
    }
}

TEST(WorkflowTypeManagerTest, FromJsonConfigFile_WrongDatetimeFormat_ShouldThrowInvalidTimestamp) {
    try {
        WorkflowTypeManager::from_json_config_file(config_path("workflow_config_wrong_datetime_format.json"));
        FAIL() << "Expected InvalidTimestampError";
    } catch (const InvalidTimestampError& e) {
        EXPECT_EQ(std::string(e.what()), "Invalid isoformat string: '2023-12-31T0:00:00'");
    }
}

TEST(WorkflowTypeManagerTest, FromJsonConfigFile_UnknownParameterType_ShouldSkipWithWarning) {
    // Given a capturing log sink
    test_support::LogCapture logs;

    // When I load a configuration with an unknown parameter type
    auto manager = WorkflowTypeManager::from_json_config_file(
        config_path("workflow_config_unknown_parameter_type.json"));

    // Then only the known parameter should remain and a warning should be logged
    const WorkflowType* workflow = manager.get_workflow_by_name("workflow_1");
    ASSERT_NE(workflow, nullptr);
    ASSERT_EQ(workflow->workflow_parameters()->size(), 1u);
    EXPECT_EQ(key_name(workflow->workflow_parameters()->front()), "bool_param");
    EXPECT_EQ(logs.count("warning"), 1u);
}

TEST(WorkflowTypeManagerTest, FromJsonConfigFile_MissingFile_ShouldThrowConfigError) {
    EXPECT_THROW(WorkflowTypeManager::from_json_config_file(config_path("does_not_exist.json")),
                 ConfigError);
}

TEST(WorkflowTypeManagerTest, FromJsonConfigFile_InvalidJson_ShouldThrowConfigError) {
    EXPECT_THROW(WorkflowTypeManager::from_json_config_file(config_path("workflow_config_invalid_json.json")),
                 ConfigError);
}

TEST(WorkflowTypeManagerTest, FromJsonConfig_MissingDescription_ShouldThrowMissingField) {
    auto config = nlohmann::json::parse(R"([{"workflow_type_name": "workflow_1"}])");

    EXPECT_THROW(WorkflowTypeManager::from_json_config(config), MissingFieldException);
}

// =============================================================================
// WorkflowTypeManager Protobuf Tests
// =============================================================================

TEST(WorkflowTypeManagerTest, ToPbMessage_Happy_ShouldListWorkflowsInOrder) {
    auto manager = WorkflowTypeManager::from_json_config_file(config_path("workflow_config_happy.json"));

    auto pb_message = manager.to_pb_message();

    ASSERT_EQ(pb_message.workflows_size(), 2);
    EXPECT_EQ(pb_message.workflows(0).type_name(), "workflow_1");
    EXPECT_EQ(pb_message.workflows(0).type_description(), "Workflow One");
    EXPECT_EQ(pb_message.workflows(0).parameters(1).string_parameter().enum_options_size(), 2);
}

TEST(WorkflowTypeManagerTest, FromPbMessage_Happy_ShouldPreserveParameterOrder) {
    // Given a manager loaded from the happy configuration
    auto manager = WorkflowTypeManager::from_json_config_file(config_path("workflow_config_happy.json"));

    // When I round trip its catalog message
    auto restored = WorkflowTypeManager::from_pb_message(manager.to_pb_message());

    // Then workflow count, names and parameter key names should match
    ASSERT_EQ(restored.get_all_workflows().size(), 2u);
    const WorkflowType* original = manager.get_workflow_by_name("workflow_1");
    const WorkflowType* copy = restored.get_workflow_by_name("workflow_1");
    ASSERT_NE(copy, nullptr);
    ASSERT_EQ(copy->workflow_parameters()->size(), original->workflow_parameters()->size());
    for (size_t i = 0; i < copy->workflow_parameters()->size(); ++i) {
        EXPECT_EQ(key_name((*copy->workflow_parameters())[i]),
                  key_name((*original->workflow_parameters())[i]));
        EXPECT_STREQ(type_name((*copy->workflow_parameters())[i]),
                     type_name((*original->workflow_parameters())[i]));
    }
    EXPECT_EQ(copy->workflow_type_description_name(), "Workflow One");
}

TEST(WorkflowTypeManagerTest, FromPbMessage_Happy_ShouldPreserveParameterSettings) {
    auto manager = WorkflowTypeManager::from_json_config_file(config_path("workflow_config_happy.json"));

    auto restored = WorkflowTypeManager::from_pb_message(manager.to_pb_message());

    const auto& parameters = *restored.get_workflow_by_name("workflow_1")->workflow_parameters();
    ASSERT_EQ(parameters.size(), 6u);

    const auto& free_text = std::get<StringParameter>(parameters[0]);
    EXPECT_EQ(free_text.default_value, std::optional<std::string>("hello"));
    EXPECT_EQ(free_text.description, std::optional<std::string>("Any text"));

    const auto& choice = std::get<StringParameter>(parameters[1]);
    ASSERT_TRUE(choice.enum_options.has_value());
    EXPECT_EQ((*choice.enum_options)[0].display_name, "Option 1");

    EXPECT_EQ(std::get<BooleanParameter>(parameters[2]).default_value, std::optional<bool>(false));

    const auto& whole = std::get<IntegerParameter>(parameters[3]);
    EXPECT_EQ(whole.minimum, std::optional<int64_t>(0));
    EXPECT_EQ(whole.maximum, std::optional<int64_t>(10));

    const auto& ratio = std::get<FloatParameter>(parameters[4]);
    EXPECT_EQ(ratio.default_value, std::optional<double>(0.5));
    EXPECT_EQ(ratio.minimum, std::optional<double>(0.0));
    EXPECT_EQ(ratio.maximum, std::optional<double>(1.5));

    const auto& start = std::get<DateTimeParameter>(parameters[5]);
    ASSERT_TRUE(start.default_value.has_value());
    EXPECT_EQ(helpers::format_iso8601(*start.default_value), "2019-01-01T00:00:00");
}

TEST(WorkflowTypeManagerTest, FromPbMessage_UnsetParameterType_ShouldThrowInvalidArgument) {
    protocol::AvailableWorkflows available_workflows;
    auto* workflow = available_workflows.add_workflows();
    workflow->set_type_name("workflow_1");
    workflow->add_parameters()->set_key_name("orphan");

    EXPECT_THROW(WorkflowTypeManager::from_pb_message(available_workflows), InvalidArgumentError);
}

// =============================================================================
// WorkflowTypeManager Lookup Tests
// =============================================================================

TEST(WorkflowTypeManagerTest, GetWorkflowByName_Unknown_ShouldReturnNullptr) {
    WorkflowTypeManager manager({WorkflowType("workflow_1", "One")});

    EXPECT_EQ(manager.get_workflow_by_name("workflow_2"), nullptr);
    EXPECT_NE(manager.get_workflow_by_name("workflow_1"), nullptr);
}

TEST(WorkflowTypeManagerTest, WorkflowExists_ShouldMatchByName) {
    WorkflowTypeManager manager({WorkflowType("workflow_1", "One")});

    EXPECT_TRUE(manager.workflow_exists(WorkflowType("workflow_1", "Renamed")));
    EXPECT_FALSE(manager.workflow_exists(WorkflowType("workflow_2", "One")));
}

TEST(WorkflowTypeManagerTest, DuplicateNames_ShouldKeepLastDefinition) {
    WorkflowTypeManager manager({WorkflowType("workflow_1", "First"), WorkflowType("workflow_1", "Second")});

    EXPECT_EQ(manager.size(), 1u);
    EXPECT_EQ(manager.get_workflow_by_name("workflow_1")->workflow_type_description_name(), "Second");
}

// =============================================================================
// Parameter Conversion Tests
// =============================================================================

class ParseWorkflowConfigParameterTest : public ::testing::Test {
protected:
    test_support::LogCapture logs_;
};

TEST_F(ParseWorkflowConfigParameterTest, PresentValue_ShouldBeReturned) {
    google::protobuf::Value value;
    value.set_number_value(7);

    auto result = parse_workflow_config_parameter<IntegerParameter>(make_config("x", value), "x");

    EXPECT_EQ(result, 7);
}

TEST_F(ParseWorkflowConfigParameterTest, EmptyConfigWithoutDefault_ShouldThrowMissingField) {
    EXPECT_THROW(parse_workflow_config_parameter<IntegerParameter>(google::protobuf::Struct(), "x"),
                 MissingFieldException);
    EXPECT_EQ(logs_.count("error"), 1u);
}

TEST_F(ParseWorkflowConfigParameterTest, EmptyConfigWithDefault_ShouldReturnDefault) {
    auto result = parse_workflow_config_parameter<IntegerParameter>(
        google::protobuf::Struct(), "x", int64_t{5});

    EXPECT_EQ(result, 5);
    EXPECT_EQ(logs_.count("warning"), 1u);
}

TEST_F(ParseWorkflowConfigParameterTest, WrongKindWithDefault_ShouldReturnDefault) {
    auto result = parse_workflow_config_parameter<IntegerParameter>(
        make_config("x", string_value("wrong-kind")), "x", int64_t{5});

    EXPECT_EQ(result, 5);
    EXPECT_EQ(logs_.count("warning"), 1u);
}

TEST_F(ParseWorkflowConfigParameterTest, WrongKindWithoutDefault_ShouldRethrow) {
    EXPECT_THROW(parse_workflow_config_parameter<IntegerParameter>(
                     make_config("x", string_value("wrong-kind")), "x"),
                 WrongFieldTypeException);
    EXPECT_EQ(logs_.count("error"), 1u);
}

TEST_F(ParseWorkflowConfigParameterTest, StringParameter_ShouldReturnString) {
    auto result = parse_workflow_config_parameter<StringParameter>(
        make_config("mode", string_value("fast")), "mode", std::string("exact"));

    EXPECT_EQ(result, "fast");
}

TEST(ConvertParamsDictTest, AllDeclaredParameters_ShouldBeConverted) {
    // Given a workflow declaring an integer and a string parameter
    auto manager = WorkflowTypeManager::from_json_config(nlohmann::json::parse(R"([{
        "workflow_type_name": "simulator",
        "workflow_type_description_name": "Simulator",
        "workflow_parameters": [
            {"parameter_type": "integer", "key_name": "steps"},
            {"parameter_type": "string", "key_name": "mode"}
        ]
    }])"));
    const WorkflowType& workflow = *manager.get_workflow_by_name("simulator");

    // When I convert values including an undeclared key
    ParamsDict params{{"steps", int64_t{10}}, {"mode", std::string("fast")}, {"extra", true}};
    auto params_struct = convert_params_dict_to_struct(workflow, params);

    // Then only declared keys should be present with wire kinds
    ASSERT_EQ(params_struct.fields_size(), 2);
    EXPECT_DOUBLE_EQ(params_struct.fields().at("steps").number_value(), 10.0);
    EXPECT_EQ(params_struct.fields().at("mode").string_value(), "fast");
}

TEST(ConvertParamsDictTest, MissingDeclaredParameter_ShouldThrowMissingField) {
    BooleanParameter flag;
    flag.key_name = "flag";
    WorkflowType workflow("simulator", "Simulator", std::vector<WorkflowParameter>{flag});

    EXPECT_THROW(convert_params_dict_to_struct(workflow, ParamsDict{}), MissingFieldException);
}

TEST(ConvertParamsDictTest, WrongValueKind_ShouldThrowWrongFieldType) {
    BooleanParameter flag;
    flag.key_name = "flag";
    WorkflowType workflow("simulator", "Simulator", std::vector<WorkflowParameter>{flag});

    ParamsDict params{{"flag", std::string("yes")}};
    EXPECT_THROW(convert_params_dict_to_struct(workflow, params), WrongFieldTypeException);
}
