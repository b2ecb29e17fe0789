#include <restcall/codec/json_codec.hpp>
#include <restcall/config/config_loader.hpp>
#include <restcall/core/log.hpp>
#include <restcall/core/terminal.hpp>
#include <restcall/dispatch/dispatcher.hpp>
#include <restcall/http/http_transport.hpp>
#include <restcall/lro/lro_executor.hpp>
#include <restcall/operation/operation_loader.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace {

constexpr int kExitSuccess = 0;

int ReportError(const restcall::Error& error, bool json_output) {
    if (json_output) {
        std::cout << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
    return error.ExitCode();
}

void InitLogging(const restcall::AppConfig& config) {
    using namespace restcall;

    auto level = LogLevel::Warn;
    if (config.verbose) {
        level = LogLevel::Debug;
    } else if (config.quiet) {
        level = LogLevel::Error;
    }

    if (config.log_file.has_value()) {
        auto sink = std::make_unique<FileSink>(*config.log_file);
        if (sink->IsOpen()) {
            InitGlobalLogger(std::move(sink), level);
            return;
        }
        std::cerr << "Warning: cannot open log file '" << *config.log_file
                  << "', logging to stderr\n";
    }
    if (config.json_output) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
        return;
    }
    InitGlobalLogger(
        std::make_unique<ColorConsoleSink>(UseColorForStderr(config.no_color)), level);
}

restcall::Result<nlohmann::json, restcall::Error> ReadBodyFile(const std::string& path) {
    using restcall::Error;
    using restcall::ErrorCategory;
    using restcall::Result;

    std::ifstream in(path);
    if (!in) {
        return Result<nlohmann::json, Error>::Err(Error::Make(
            "ReadBodyFile", "", "cannot open body file '" + path + "'",
            ErrorCategory::InvalidArgument));
    }
    try {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json::parse(in));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(Error::Make(
            "ReadBodyFile", "", "body file '" + path + "' is not valid JSON: " + e.what(),
            ErrorCategory::Serialization));
    }
}

void PrintValue(const restcall::ResponseValue& value, bool json_output) {
    using restcall::ByteBuffer;
    using restcall::ResponseStream;

    if (const auto* json = std::get_if<nlohmann::json>(&value)) {
        std::cout << json->dump(json_output ? -1 : 2) << "\n";
    } else if (const auto* bytes = std::get_if<ByteBuffer>(&value)) {
        std::cout.write(reinterpret_cast<const char*>(bytes->data()),
                        static_cast<std::streamsize>(bytes->size()));
    } else if (const auto* stream = std::get_if<ResponseStream>(&value)) {
        if (*stream) {
            std::cout << (*stream)->rdbuf();
        }
    } else if (json_output) {
        std::cout << "null\n";
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace restcall;

    std::optional<std::string> config_file;
    auto cli = LoadFromCli(argc, argv, &config_file);
    if (cli.IsErr()) {
        return ReportError(cli.Error(), false);
    }

    AppConfig config = cli.Value();
    if (config_file.has_value()) {
        auto yaml = LoadFromYaml(*config_file);
        if (yaml.IsErr()) {
            return ReportError(yaml.Error(), cli.Value().json_output);
        }
        config = MergeConfigs(yaml.Value(), cli.Value());
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return ReportError(valid.Error(), config.json_output);
    }

    InitLogging(config);

    const ErrorKindRegistry error_kinds;
    auto operations = LoadOperationsFromYaml(config.operations_file, error_kinds);
    if (operations.IsErr()) {
        return ReportError(operations.Error(), config.json_output);
    }
    const auto& registry = operations.Value();

    if (config.invocation.list_operations) {
        for (const auto& name : registry.Names()) {
            std::cout << name << "\n";
        }
        return kExitSuccess;
    }

    auto descriptor = registry.Find(config.invocation.operation);
    if (descriptor.IsErr()) {
        return ReportError(descriptor.Error(), config.json_output);
    }

    auto args = config.invocation.args;
    if (config.invocation.body_file.has_value()) {
        const auto& body_arg = descriptor.Value()->BodyArgument();
        if (!body_arg.has_value()) {
            return ReportError(
                Error::Make(config.invocation.operation, "",
                            "--body-file given but the operation takes no body",
                            ErrorCategory::InvalidArgument),
                config.json_output);
        }
        auto body = ReadBodyFile(*config.invocation.body_file);
        if (body.IsErr()) {
            return ReportError(body.Error(), config.json_output);
        }
        args[*body_arg] = std::move(body).Value();
    }

    HttpTransportOptions transport_options;
    transport_options.connect_timeout = std::chrono::seconds(config.transport.connect_timeout_seconds);
    transport_options.read_timeout = std::chrono::seconds(config.transport.read_timeout_seconds);
    transport_options.disable_tls_verify = config.transport.disable_tls_verify;
    transport_options.follow_redirects = config.transport.follow_redirects;

    Dispatcher dispatcher(std::make_shared<HttpTransport>(transport_options),
                          std::make_shared<JsonCodec>());

    if (config.invocation.wait) {
        LroOptions lro_options;
        lro_options.initial_poll_delay = std::chrono::milliseconds(config.poll.initial_delay_ms);
        if (config.poll.timeout_seconds.has_value()) {
            lro_options.driver.timeout = std::chrono::seconds(*config.poll.timeout_seconds);
        }
        LroExecutor executor(dispatcher, std::move(lro_options));
        auto result = executor.Run(descriptor.Value(), args);
        if (result.IsErr()) {
            return ReportError(result.Error(), config.json_output);
        }
        LogInfo("cli", config.invocation.operation + " finished with status " +
                           std::to_string(result.Value().final_response.status_code));
        PrintValue(result.Value().value, config.json_output);
        return kExitSuccess;
    }

    auto result = Await(dispatcher.Execute(descriptor.Value(), args));
    if (result.IsErr()) {
        return ReportError(result.Error(), config.json_output);
    }
    PrintValue(result.Value(), config.json_output);
    return kExitSuccess;
}
