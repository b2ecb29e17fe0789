#include <restcall/operation/operation_loader.hpp>
#include <restcall/core/log.hpp>

#include <yaml-cpp/yaml.h>

namespace restcall {

namespace {

Error MakeLoaderError(const std::string& message) {
    return Error::Make("OperationLoader", "", message, ErrorCategory::Configuration);
}

Result<JsonKind, Error> ParseJsonKind(const std::string& name) {
    for (auto kind : {JsonKind::Any, JsonKind::Object, JsonKind::Array,
                      JsonKind::String, JsonKind::Number, JsonKind::Boolean}) {
        if (JsonKindName(kind) == name) {
            return Result<JsonKind, Error>::Ok(kind);
        }
    }
    return Result<JsonKind, Error>::Err(
        MakeLoaderError("unknown JSON kind '" + name + "'"));
}

// {type, json, required}
Result<ValueShape, Error> ParseValueShape(const YAML::Node& node) {
    ValueShape shape;
    if (node["type"]) {
        shape.type_name = node["type"].as<std::string>();
    }
    if (node["json"]) {
        auto kind = ParseJsonKind(node["json"].as<std::string>());
        if (kind.IsErr()) {
            return Result<ValueShape, Error>::Err(std::move(kind).Error());
        }
        shape.kind = kind.Value();
    }
    if (node["required"]) {
        for (const auto& field : node["required"]) {
            shape.required_fields.push_back(field.as<std::string>());
        }
    }
    return Result<ValueShape, Error>::Ok(std::move(shape));
}

Result<OperationDescriptorPtr, Error> ParseOperation(const YAML::Node& node,
                                                     const YAML::Node& defaults,
                                                     const ErrorKindRegistry& error_kinds) {
    if (!node["name"]) {
        return Result<OperationDescriptorPtr, Error>::Err(
            MakeLoaderError("operation entry missing 'name' field"));
    }
    const auto name = node["name"].as<std::string>();
    auto fail = [&](const std::string& message) {
        return Result<OperationDescriptorPtr, Error>::Err(
            MakeLoaderError("operation '" + name + "': " + message));
    };

    OperationDescriptorBuilder builder(name);

    if (node["method"]) {
        builder.Method(node["method"].as<std::string>());
    }
    if (node["scheme"]) {
        builder.Scheme(node["scheme"].as<std::string>());
    } else if (defaults["scheme"]) {
        builder.Scheme(defaults["scheme"].as<std::string>());
    }
    if (node["host"]) {
        builder.Host(node["host"].as<std::string>());
    } else if (defaults["host"]) {
        builder.Host(defaults["host"].as<std::string>());
    }
    if (node["path"]) {
        builder.Path(node["path"].as<std::string>());
    }

    for (const auto& param : node["host_params"]) {
        if (!param["placeholder"] || !param["arg"]) {
            return fail("host_params entries need 'placeholder' and 'arg'");
        }
        builder.HostParam(param["placeholder"].as<std::string>(),
                          param["arg"].as<std::string>());
    }
    for (const auto& param : node["path_params"]) {
        if (!param["placeholder"] || !param["arg"]) {
            return fail("path_params entries need 'placeholder' and 'arg'");
        }
        builder.PathParam(param["placeholder"].as<std::string>(),
                          param["arg"].as<std::string>(),
                          param["encoded"] ? param["encoded"].as<bool>() : false);
    }
    for (const auto& query : node["query"]) {
        if (!query["name"]) {
            return fail("query entry missing 'name'");
        }
        auto query_name = query["name"].as<std::string>();
        if (query["arg"]) {
            builder.Query(std::move(query_name), query["arg"].as<std::string>(),
                          query["encoded"] ? query["encoded"].as<bool>() : false);
        } else if (query["value"]) {
            builder.QueryConstant(std::move(query_name), query["value"].as<std::string>());
        } else {
            return fail("query '" + query_name + "' needs 'arg' or 'value'");
        }
    }
    for (const auto& header : node["headers"]) {
        if (!header["name"]) {
            return fail("header entry missing 'name'");
        }
        auto header_name = header["name"].as<std::string>();
        if (header["arg"]) {
            builder.Header(std::move(header_name), header["arg"].as<std::string>());
        } else if (header["value"]) {
            builder.HeaderConstant(std::move(header_name), header["value"].as<std::string>());
        } else {
            return fail("header '" + header_name + "' needs 'arg' or 'value'");
        }
    }
    if (node["body"]) {
        builder.Body(node["body"].as<std::string>());
    }
    if (node["expected"]) {
        for (const auto& status : node["expected"]) {
            builder.Expect(status.as<int>());
        }
    }
    if (node["returns"]) {
        auto shape = ParseReturnShape(node["returns"].as<std::string>());
        if (shape.IsErr()) {
            return fail(shape.Error().message);
        }
        builder.Returns(shape.Value());
    }
    if (const auto success = node["success_body"]) {
        BodyShape body;
        if (success["kind"]) {
            auto kind = ParseBodyKind(success["kind"].as<std::string>());
            if (kind.IsErr()) {
                return fail(kind.Error().message);
            }
            body.kind = kind.Value();
        } else {
            body.kind = BodyKind::Typed;
        }
        auto value = ParseValueShape(success);
        if (value.IsErr()) {
            return fail(value.Error().message);
        }
        body.value = std::move(value).Value();
        builder.SuccessBody(std::move(body));
    }
    if (const auto error = node["error"]) {
        if (error["kind"]) {
            auto kind_name = error["kind"].as<std::string>();
            const auto* factory = error_kinds.Find(kind_name);
            if (factory == nullptr) {
                return fail("unknown error kind '" + kind_name + "'");
            }
            builder.ErrorKind(kind_name, *factory);
        }
        if (error["body"]) {
            auto shape = ParseValueShape(error["body"]);
            if (shape.IsErr()) {
                return fail(shape.Error().message);
            }
            builder.ErrorBody(std::move(shape).Value());
        }
    }

    return builder.Build();
}

Result<OperationRegistry, Error> ParseOperations(const YAML::Node& root,
                                                 const ErrorKindRegistry& error_kinds) {
    if (!root["operations"] || !root["operations"].IsSequence()) {
        return Result<OperationRegistry, Error>::Err(
            MakeLoaderError("missing 'operations' list"));
    }

    const auto defaults = root["defaults"];
    OperationRegistry registry;
    for (const auto& node : root["operations"]) {
        auto descriptor = ParseOperation(node, defaults, error_kinds);
        if (descriptor.IsErr()) {
            return Result<OperationRegistry, Error>::Err(std::move(descriptor).Error());
        }
        auto registered = registry.Register(std::move(descriptor).Value());
        if (registered.IsErr()) {
            return Result<OperationRegistry, Error>::Err(std::move(registered).Error());
        }
    }
    LogDebug("config", "loaded " + std::to_string(registry.Size()) + " operations");
    return Result<OperationRegistry, Error>::Ok(std::move(registry));
}

} // anonymous namespace

Result<OperationRegistry, Error> LoadOperationsFromYaml(std::string_view file_path,
                                                        const ErrorKindRegistry& error_kinds) {
    try {
        return ParseOperations(YAML::LoadFile(std::string(file_path)), error_kinds);
    } catch (const YAML::Exception& e) {
        return Result<OperationRegistry, Error>::Err(MakeLoaderError(
            "failed to parse operations file '" + std::string(file_path) + "': " + e.what()));
    }
}

Result<OperationRegistry, Error> LoadOperationsFromYamlString(std::string_view yaml,
                                                              const ErrorKindRegistry& error_kinds) {
    try {
        return ParseOperations(YAML::Load(std::string(yaml)), error_kinds);
    } catch (const YAML::Exception& e) {
        return Result<OperationRegistry, Error>::Err(
            MakeLoaderError("failed to parse operations: " + std::string(e.what())));
    }
}

} // namespace restcall
