#include <restcall/config/config_loader.hpp>

#include <restcall/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <vector>

namespace restcall {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error::Make("ConfigLoader", "", message, ErrorCategory::Configuration);
}

// Reads argument text as JSON where that is lossless. Numbers whose canonical
// form differs from the text ("1.10", "1e3", "007") stay strings.
nlohmann::json ArgumentValue(const std::string& text, bool allow_containers) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return text;
    }
    if (parsed.is_structured() && !allow_containers) {
        return text;
    }
    if (parsed.is_number() && parsed.dump() != text) {
        return text;
    }
    return parsed;
}

// Convert a YAML scalar/map/sequence into JSON for call arguments.
nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            auto object = nlohmann::json::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = YamlToJson(entry.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            auto array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(YamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            // Quoted scalars stay strings; plain ones may be numbers/booleans.
            const auto& text = node.Scalar();
            if (node.Tag() != "!") {
                return ArgumentValue(text, false);
            }
            return text;
        }
        default:
            return nullptr;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseCallArgument
// ---------------------------------------------------------------------------
Result<std::pair<std::string, nlohmann::json>, Error> ParseCallArgument(std::string_view text) {
    using R = Result<std::pair<std::string, nlohmann::json>, Error>;
    auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return R::Err(MakeConfigError("call argument '" + std::string(text) +
                                      "' must look like name=value"));
    }
    std::string name(text.substr(0, eq));
    std::string raw(text.substr(eq + 1));
    return R::Ok({std::move(name), ArgumentValue(raw, true)});
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        if (root["operations"]) {
            config.operations_file = root["operations"].as<std::string>();
        }

        // -- Transport --
        if (const auto transport = root["transport"]) {
            if (transport["connect_timeout"]) {
                config.transport.connect_timeout_seconds = transport["connect_timeout"].as<int>();
            }
            if (transport["read_timeout"]) {
                config.transport.read_timeout_seconds = transport["read_timeout"].as<int>();
            }
            if (transport["insecure"]) {
                config.transport.disable_tls_verify = transport["insecure"].as<bool>();
            }
            if (transport["follow_redirects"]) {
                config.transport.follow_redirects = transport["follow_redirects"].as<bool>();
            }
        }

        // -- Polling --
        if (const auto poll = root["poll"]) {
            if (poll["initial_delay_ms"]) {
                config.poll.initial_delay_ms = poll["initial_delay_ms"].as<int>();
            }
            if (poll["timeout"]) {
                config.poll.timeout_seconds = poll["timeout"].as<int>();
            }
        }

        // -- Default call arguments --
        if (const auto args = root["args"]) {
            if (!args.IsMap()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("'args' must be a mapping of argument names to values"));
            }
            config.invocation.args = YamlToJson(args);
        }

        // -- Options --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
        if (root["no_color"]) {
            config.no_color = root["no_color"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::optional<std::string>* config_file) {
    argparse::ArgumentParser program("restcall", kVersion);

    program.add_argument("operation")
        .help("Name of the operation to call")
        .default_value(std::string{});

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("-o", "--operations")
        .help("Path to YAML operations file");
    program.add_argument("-a", "--arg")
        .help("Call argument as name=value (value parsed as JSON when possible)")
        .default_value(std::vector<std::string>{})
        .append();
    program.add_argument("--body-file")
        .help("JSON file used as the operation's body argument");
    program.add_argument("--wait")
        .help("Poll a long-running operation until it completes")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--list")
        .help("List the operations in the operations file")
        .default_value(false)
        .implicit_value(true);

    // Transport and polling
    program.add_argument("--connect-timeout")
        .help("Connect timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--read-timeout")
        .help("Read timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--follow-redirects")
        .help("Follow HTTP redirects")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--poll-delay")
        .help("Initial poll delay in milliseconds")
        .scan<'i', int>();
    program.add_argument("--poll-timeout")
        .help("Give up polling after this many seconds")
        .scan<'i', int>();

    // Options
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (config_file != nullptr) {
        *config_file = program.present("--config");
    }
    if (auto val = program.present("--operations")) {
        config.operations_file = *val;
    }

    // Invocation
    config.invocation.operation = program.get<std::string>("operation");
    for (const auto& text : program.get<std::vector<std::string>>("--arg")) {
        auto parsed = ParseCallArgument(text);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(parsed).Error());
        }
        auto [name, value] = std::move(parsed).Value();
        config.invocation.args[name] = std::move(value);
    }
    if (auto val = program.present("--body-file")) {
        config.invocation.body_file = *val;
    }
    config.invocation.wait = program.get<bool>("--wait");
    config.invocation.list_operations = program.get<bool>("--list");

    // Transport and polling
    if (auto val = program.present<int>("--connect-timeout")) {
        config.transport.connect_timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--read-timeout")) {
        config.transport.read_timeout_seconds = *val;
    }
    if (program.get<bool>("--insecure")) {
        config.transport.disable_tls_verify = true;
    }
    if (program.get<bool>("--follow-redirects")) {
        config.transport.follow_redirects = true;
    }
    if (auto val = program.present<int>("--poll-delay")) {
        config.poll.initial_delay_ms = *val;
    }
    if (auto val = program.present<int>("--poll-timeout")) {
        config.poll.timeout_seconds = *val;
    }

    // Options
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    if (program.get<bool>("--no-color")) {
        config.no_color = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    if (!cli_overrides.operations_file.empty()) {
        merged.operations_file = cli_overrides.operations_file;
    }

    // Transport overrides
    const auto& transport = cli_overrides.transport;
    if (transport.connect_timeout_seconds != defaults.transport.connect_timeout_seconds) {
        merged.transport.connect_timeout_seconds = transport.connect_timeout_seconds;
    }
    if (transport.read_timeout_seconds != defaults.transport.read_timeout_seconds) {
        merged.transport.read_timeout_seconds = transport.read_timeout_seconds;
    }
    if (transport.disable_tls_verify) {
        merged.transport.disable_tls_verify = true;
    }
    if (transport.follow_redirects) {
        merged.transport.follow_redirects = true;
    }

    // Polling overrides
    if (cli_overrides.poll.initial_delay_ms != defaults.poll.initial_delay_ms) {
        merged.poll.initial_delay_ms = cli_overrides.poll.initial_delay_ms;
    }
    if (cli_overrides.poll.timeout_seconds.has_value()) {
        merged.poll.timeout_seconds = cli_overrides.poll.timeout_seconds;
    }

    // Invocation: CLI arguments override same-named YAML defaults
    const auto& invocation = cli_overrides.invocation;
    if (!invocation.operation.empty()) {
        merged.invocation.operation = invocation.operation;
    }
    if (!merged.invocation.args.is_object()) {
        merged.invocation.args = nlohmann::json::object();
    }
    for (const auto& [name, value] : invocation.args.items()) {
        merged.invocation.args[name] = value;
    }
    if (invocation.body_file.has_value()) {
        merged.invocation.body_file = invocation.body_file;
    }
    if (invocation.wait) {
        merged.invocation.wait = true;
    }
    if (invocation.list_operations) {
        merged.invocation.list_operations = true;
    }

    // Options
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.no_color) {
        merged.no_color = true;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.operations_file.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: operations file"));
    }
    if (config.invocation.operation.empty() && !config.invocation.list_operations) {
        return Result<void, Error>::Err(
            MakeConfigError("No operation given (use --list to see the available ones)"));
    }
    if (config.transport.connect_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid connect timeout: must be positive"));
    }
    if (config.transport.read_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid read timeout: must be positive"));
    }
    if (config.poll.initial_delay_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid poll delay: must not be negative"));
    }
    if (config.poll.timeout_seconds.has_value() && *config.poll.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid poll timeout: must be positive"));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("--verbose and --quiet are mutually exclusive"));
    }
    return Result<void, Error>::Ok();
}

} // namespace restcall
