#include <catch2/catch_test_macros.hpp>

#include <restcall/config/config_loader.hpp>
#include <restcall/core/terminal.hpp>

#include <string>
#include <vector>

using namespace restcall;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the testdata path from this
// file's location in the source tree.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.operations_file == "operations.yaml");
    CHECK(config.transport.connect_timeout_seconds == 10);
    CHECK(config.transport.read_timeout_seconds == 60);
    CHECK(config.transport.disable_tls_verify);
    CHECK(config.transport.follow_redirects);
    CHECK(config.poll.initial_delay_ms == 500);
    CHECK(config.poll.timeout_seconds == std::optional<int>(300));

    const auto& args = config.invocation.args;
    CHECK(args["endpoint"] == "https://widgets.example.com");
    CHECK(args["widgetId"] == "42");  // quoted stays a string
    CHECK(args["retries"] == 3);
    CHECK(args["tags"] == nlohmann::json::array({"blue", "large"}));
    CHECK(args["apiVersion"] == "1.10");  // would lose its trailing zero as a number
    CHECK(args["limit"] == "1e3");

    CHECK(config.log_file == std::optional<std::string>("/tmp/restcall.log"));
    CHECK(config.json_output);
    CHECK(config.verbose);
    CHECK_FALSE(config.quiet);
    CHECK(config.no_color);
}

TEST_CASE("LoadFromYaml: minimal config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.operations_file == "operations.yaml");
    CHECK(config.transport.connect_timeout_seconds == 30);   // default
    CHECK(config.transport.read_timeout_seconds == 120);     // default
    CHECK(config.poll.initial_delay_ms == 2000);             // default
    CHECK_FALSE(config.poll.timeout_seconds.has_value());
    CHECK(config.invocation.args.empty());
    CHECK_FALSE(config.log_file.has_value());
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

TEST_CASE("LoadFromYaml: args must be a mapping", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_args_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("'args' must be a mapping") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: operation and arguments", "[config][cli]") {
    const char* argv[] = {
        "restcall",
        "Widgets.get",
        "-o", "ops.yaml",
        "-a", "widgetId=w1",
        "--arg", "count=3",
        "--arg", R"(filter={"color":"blue"})",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.operations_file == "ops.yaml");
    CHECK(config.invocation.operation == "Widgets.get");
    CHECK(config.invocation.args["widgetId"] == "w1");
    CHECK(config.invocation.args["count"] == 3);
    CHECK(config.invocation.args["filter"]["color"] == "blue");
    CHECK_FALSE(config.invocation.wait);
    CHECK_FALSE(config.invocation.list_operations);
}

TEST_CASE("LoadFromCli: transport and polling flags", "[config][cli]") {
    const char* argv[] = {
        "restcall", "Widgets.create",
        "--connect-timeout", "5",
        "--read-timeout", "15",
        "--insecure",
        "--follow-redirects",
        "--wait",
        "--poll-delay", "250",
        "--poll-timeout", "90",
        "--body-file", "widget.json",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.transport.connect_timeout_seconds == 5);
    CHECK(config.transport.read_timeout_seconds == 15);
    CHECK(config.transport.disable_tls_verify);
    CHECK(config.transport.follow_redirects);
    CHECK(config.invocation.wait);
    CHECK(config.poll.initial_delay_ms == 250);
    CHECK(config.poll.timeout_seconds == std::optional<int>(90));
    CHECK(config.invocation.body_file == std::optional<std::string>("widget.json"));
}

TEST_CASE("LoadFromCli: output flags and config file", "[config][cli]") {
    const char* argv[] = {
        "restcall", "--list", "--json", "-v",
        "--log-file", "out.log",
        "-c", "restcall.yaml",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    std::optional<std::string> config_file;
    auto result = LoadFromCli(argc, argv, &config_file);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.invocation.list_operations);
    CHECK(config.invocation.operation.empty());
    CHECK(config.json_output);
    CHECK(config.verbose);
    CHECK(config.log_file == std::optional<std::string>("out.log"));
    CHECK(config_file == std::optional<std::string>("restcall.yaml"));
    CHECK_FALSE(config.no_color);
}

TEST_CASE("LoadFromCli: --no-color turns off colored logs", "[config][cli]") {
    const char* argv[] = {"restcall", "Widgets.get", "--no-color"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto cli_result = LoadFromCli(argc, argv);
    REQUIRE(cli_result.IsOk());
    CHECK(cli_result.Value().no_color);

    auto merged = MergeConfigs(AppConfig{}, cli_result.Value());
    CHECK(merged.no_color);
    CHECK_FALSE(UseColorForStderr(merged.no_color));
}

TEST_CASE("LoadFromCli: malformed call argument", "[config][cli]") {
    const char* argv[] = {"restcall", "Widgets.get", "-a", "widgetId"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

TEST_CASE("LoadFromCli: invalid number", "[config][cli]") {
    const char* argv[] = {"restcall", "Widgets.get", "--read-timeout", "soon"};
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// ParseCallArgument
// ===========================================================================

TEST_CASE("ParseCallArgument: JSON values and plain strings", "[config][args]") {
    auto number = ParseCallArgument("count=7");
    REQUIRE(number.IsOk());
    CHECK(number.Value().first == "count");
    CHECK(number.Value().second == 7);

    auto text = ParseCallArgument("name=blue bolt");
    REQUIRE(text.IsOk());
    CHECK(text.Value().second == "blue bolt");

    auto with_equals = ParseCallArgument("filter=a=b");
    REQUIRE(with_equals.IsOk());
    CHECK(with_equals.Value().second == "a=b");

    auto empty = ParseCallArgument("token=");
    REQUIRE(empty.IsOk());
    CHECK(empty.Value().second == "");

    auto object = ParseCallArgument(R"(widget={"name":"bolt"})");
    REQUIRE(object.IsOk());
    CHECK(object.Value().second["name"] == "bolt");
}

TEST_CASE("ParseCallArgument: numbers keep their exact text", "[config][args]") {
    auto version = ParseCallArgument("apiVersion=1.10");
    REQUIRE(version.IsOk());
    CHECK(version.Value().second == "1.10");

    auto exponent = ParseCallArgument("id=1e3");
    REQUIRE(exponent.IsOk());
    CHECK(exponent.Value().second == "1e3");

    auto padded = ParseCallArgument("code=007");
    REQUIRE(padded.IsOk());
    CHECK(padded.Value().second == "007");

    auto integer = ParseCallArgument("count=3");
    REQUIRE(integer.IsOk());
    CHECK(integer.Value().second == 3);

    auto fraction = ParseCallArgument("ratio=0.5");
    REQUIRE(fraction.IsOk());
    CHECK(fraction.Value().second == 0.5);

    auto flag = ParseCallArgument("dryRun=true");
    REQUIRE(flag.IsOk());
    CHECK(flag.Value().second == true);
}

TEST_CASE("ParseCallArgument: name is required", "[config][args]") {
    CHECK(ParseCallArgument("=value").IsErr());
    CHECK(ParseCallArgument("novalue").IsErr());
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML values", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml_result.IsOk());

    const char* argv[] = {
        "restcall", "Widgets.get",
        "-o", "other.yaml",
        "--read-timeout", "5",
        "--poll-timeout", "20",
        "-a", "widgetId=w9",
    };
    int argc = sizeof(argv) / sizeof(argv[0]);
    auto cli_result = LoadFromCli(argc, argv);
    REQUIRE(cli_result.IsOk());

    auto merged = MergeConfigs(yaml_result.Value(), cli_result.Value());

    CHECK(merged.operations_file == "other.yaml");
    CHECK(merged.invocation.operation == "Widgets.get");
    CHECK(merged.transport.read_timeout_seconds == 5);
    CHECK(merged.transport.connect_timeout_seconds == 10);  // from YAML
    CHECK(merged.poll.timeout_seconds == std::optional<int>(20));
    CHECK(merged.invocation.args["widgetId"] == "w9");
    CHECK(merged.invocation.args["endpoint"] == "https://widgets.example.com");
}

TEST_CASE("MergeConfigs: YAML values preserved when CLI not set", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml_result.IsOk());

    const char* argv[] = {"restcall"};
    int argc = 1;
    auto cli_result = LoadFromCli(argc, argv);
    REQUIRE(cli_result.IsOk());

    auto merged = MergeConfigs(yaml_result.Value(), cli_result.Value());
    CHECK(merged.operations_file == "operations.yaml");
    CHECK(merged.poll.initial_delay_ms == 500);
    CHECK(merged.transport.disable_tls_verify);
    CHECK(merged.log_file == std::optional<std::string>("/tmp/restcall.log"));
    CHECK(merged.invocation.args.size() == 6);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

namespace {

AppConfig ValidConfig() {
    AppConfig config;
    config.operations_file = "operations.yaml";
    config.invocation.operation = "Widgets.get";
    return config;
}

} // anonymous namespace

TEST_CASE("ValidateConfig: valid config passes", "[config][validate]") {
    CHECK(ValidateConfig(ValidConfig()).IsOk());
}

TEST_CASE("ValidateConfig: --list needs no operation", "[config][validate]") {
    auto config = ValidConfig();
    config.invocation.operation.clear();
    CHECK(ValidateConfig(config).IsErr());
    config.invocation.list_operations = true;
    CHECK(ValidateConfig(config).IsOk());
}

TEST_CASE("ValidateConfig: missing operations file", "[config][validate]") {
    auto config = ValidConfig();
    config.operations_file.clear();
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("operations file") != std::string::npos);
}

TEST_CASE("ValidateConfig: invalid timeouts and delays", "[config][validate]") {
    auto config = ValidConfig();
    config.transport.connect_timeout_seconds = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.transport.read_timeout_seconds = -1;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.poll.initial_delay_ms = -5;
    CHECK(ValidateConfig(config).IsErr());

    config = ValidConfig();
    config.poll.initial_delay_ms = 0;
    CHECK(ValidateConfig(config).IsOk());

    config = ValidConfig();
    config.poll.timeout_seconds = 0;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: verbose and quiet conflict", "[config][validate]") {
    auto config = ValidConfig();
    config.verbose = true;
    config.quiet = true;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().ExitCode() == 8);
}
