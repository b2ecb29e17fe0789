#include <restcall/operation/operation_descriptor.hpp>
#include <restcall/core/url.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace restcall {

namespace {

constexpr std::array<std::string_view, 7> kMethods = {
    "GET", "PUT", "POST", "PATCH", "DELETE", "HEAD", "OPTIONS",
};

Error MakeDescriptorError(const std::string& operation, const std::string& message) {
    return Error::Make(operation, "", message, ErrorCategory::Configuration);
}

// Placeholder names in template order. Fails on an unterminated or empty
// placeholder.
Result<std::vector<std::string>, std::string> Placeholders(std::string_view tmpl) {
    std::vector<std::string> names;
    size_t pos = 0;
    while ((pos = tmpl.find('{', pos)) != std::string_view::npos) {
        auto close = tmpl.find('}', pos + 1);
        if (close == std::string_view::npos) {
            return Result<std::vector<std::string>, std::string>::Err(
                "unterminated placeholder in '" + std::string(tmpl) + "'");
        }
        auto name = tmpl.substr(pos + 1, close - pos - 1);
        if (name.empty() || name.find('{') != std::string_view::npos) {
            return Result<std::vector<std::string>, std::string>::Err(
                "malformed placeholder in '" + std::string(tmpl) + "'");
        }
        names.emplace_back(name);
        pos = close + 1;
    }
    return Result<std::vector<std::string>, std::string>::Ok(std::move(names));
}

const SubstitutionBinding* FindBinding(const std::vector<SubstitutionBinding>& bindings,
                                       const std::string& placeholder) {
    auto it = std::find_if(bindings.begin(), bindings.end(),
                           [&](const SubstitutionBinding& b) {
                               return b.placeholder == placeholder;
                           });
    return it == bindings.end() ? nullptr : &*it;
}

// Replace every `{name}` in `tmpl`. Templates were validated by Build().
Result<std::string, Error> Substitute(const std::string& operation,
                                      const std::string& tmpl,
                                      const std::vector<SubstitutionBinding>& bindings,
                                      const CallArgs& args,
                                      bool encode) {
    std::string out;
    out.reserve(tmpl.size());
    size_t pos = 0;
    while (pos < tmpl.size()) {
        auto open = tmpl.find('{', pos);
        if (open == std::string::npos) {
            out.append(tmpl, pos, std::string::npos);
            break;
        }
        out.append(tmpl, pos, open - pos);
        auto close = tmpl.find('}', open + 1);
        const auto placeholder = tmpl.substr(open + 1, close - open - 1);

        const auto* binding = FindBinding(bindings, placeholder);
        const auto& arg_name = binding != nullptr ? binding->arg_name : placeholder;
        auto value = ArgumentText(args, arg_name);
        if (!value.has_value()) {
            return Result<std::string, Error>::Err(Error::Make(
                operation, "",
                "missing value for '{" + placeholder + "}' (argument '" + arg_name + "')",
                ErrorCategory::InvalidArgument));
        }
        const bool already_encoded = binding != nullptr && binding->already_encoded;
        out += encode && !already_encoded ? UrlEncode(*value) : *value;
        pos = close + 1;
    }
    return Result<std::string, Error>::Ok(std::move(out));
}

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------
std::string ReturnShapeName(ReturnShape shape) {
    switch (shape) {
        case ReturnShape::FireAndForget:      return "fire-and-forget";
        case ReturnShape::DeferredValue:      return "deferred-value";
        case ReturnShape::DeferredCompletion: return "deferred-completion";
        case ReturnShape::BlockingValue:      return "blocking-value";
    }
    return "blocking-value";
}

Result<ReturnShape, Error> ParseReturnShape(std::string_view name) {
    for (auto shape : {ReturnShape::FireAndForget, ReturnShape::DeferredValue,
                       ReturnShape::DeferredCompletion, ReturnShape::BlockingValue}) {
        if (ReturnShapeName(shape) == name) {
            return Result<ReturnShape, Error>::Ok(shape);
        }
    }
    return Result<ReturnShape, Error>::Err(MakeDescriptorError(
        "ParseReturnShape", "unknown return shape '" + std::string(name) + "'"));
}

std::string BodyKindName(BodyKind kind) {
    switch (kind) {
        case BodyKind::None:      return "none";
        case BodyKind::RawStream: return "raw-stream";
        case BodyKind::RawBytes:  return "raw-bytes";
        case BodyKind::Typed:     return "typed";
    }
    return "none";
}

Result<BodyKind, Error> ParseBodyKind(std::string_view name) {
    for (auto kind : {BodyKind::None, BodyKind::RawStream, BodyKind::RawBytes,
                      BodyKind::Typed}) {
        if (BodyKindName(kind) == name) {
            return Result<BodyKind, Error>::Ok(kind);
        }
    }
    return Result<BodyKind, Error>::Err(MakeDescriptorError(
        "ParseBodyKind", "unknown body kind '" + std::string(name) + "'"));
}

std::optional<std::string> ArgumentText(const CallArgs& args, const std::string& name) {
    if (!args.is_object()) {
        return std::nullopt;
    }
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

// ---------------------------------------------------------------------------
// OperationDescriptor
// ---------------------------------------------------------------------------
bool OperationDescriptor::IsExpectedStatus(int status) const {
    if (expected_statuses_.empty()) {
        return status < 400;
    }
    return expected_statuses_.count(status) > 0;
}

bool OperationDescriptor::IsExpectedStatus(int status,
                                           std::initializer_list<int> additional) const {
    if (std::find(additional.begin(), additional.end(), status) != additional.end()) {
        return true;
    }
    return IsExpectedStatus(status);
}

Result<std::string, Error> OperationDescriptor::ResolveScheme(const CallArgs& args) const {
    return Substitute(name_, scheme_, {}, args, false);
}

Result<std::string, Error> OperationDescriptor::ResolveHost(const CallArgs& args) const {
    return Substitute(name_, host_, host_bindings_, args, false);
}

Result<std::string, Error> OperationDescriptor::ResolvePath(const CallArgs& args) const {
    return Substitute(name_, path_, path_bindings_, args, true);
}

std::vector<std::pair<std::string, std::string>> OperationDescriptor::EncodedQueryParameters(
    const CallArgs& args) const {
    std::vector<std::pair<std::string, std::string>> params;
    for (const auto& binding : query_bindings_) {
        std::optional<std::string> value;
        if (binding.arg_name.has_value()) {
            value = ArgumentText(args, *binding.arg_name);
        } else {
            value = binding.constant_value;
        }
        if (!value.has_value()) {
            continue;
        }
        params.emplace_back(binding.name,
                            binding.already_encoded ? *value : UrlEncode(*value));
    }
    return params;
}

HttpHeaders OperationDescriptor::Headers(const CallArgs& args) const {
    HttpHeaders headers;
    for (const auto& binding : header_bindings_) {
        if (binding.arg_name.has_value()) {
            auto value = ArgumentText(args, *binding.arg_name);
            if (value.has_value()) {
                headers[binding.name] = *value;
            }
        } else {
            headers[binding.name] = binding.constant_value;
        }
    }
    return headers;
}

std::optional<nlohmann::json> OperationDescriptor::Body(const CallArgs& args) const {
    if (!body_arg_.has_value() || !args.is_object()) {
        return std::nullopt;
    }
    auto it = args.find(*body_arg_);
    if (it == args.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

// ---------------------------------------------------------------------------
// OperationDescriptorBuilder
// ---------------------------------------------------------------------------
OperationDescriptorBuilder::OperationDescriptorBuilder(std::string name) {
    draft_.name_ = std::move(name);
    draft_.error_factory_ = MakeErrorFactory<ServiceError>();
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Method(std::string method) {
    draft_.method_ = ToUpper(std::move(method));
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Scheme(std::string scheme_template) {
    draft_.scheme_ = std::move(scheme_template);
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Host(std::string host_template) {
    draft_.host_ = std::move(host_template);
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Path(std::string path_template) {
    draft_.path_ = std::move(path_template);
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::HostParam(std::string placeholder,
                                                                  std::string arg_name) {
    draft_.host_bindings_.push_back({std::move(placeholder), std::move(arg_name), false});
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::PathParam(std::string placeholder,
                                                                  std::string arg_name,
                                                                  bool already_encoded) {
    draft_.path_bindings_.push_back(
        {std::move(placeholder), std::move(arg_name), already_encoded});
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Query(std::string name,
                                                              std::string arg_name,
                                                              bool already_encoded) {
    draft_.query_bindings_.push_back(
        {std::move(name), std::move(arg_name), "", already_encoded});
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::QueryConstant(std::string name,
                                                                      std::string value) {
    draft_.query_bindings_.push_back(
        {std::move(name), std::nullopt, std::move(value), false});
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Header(std::string name,
                                                               std::string arg_name) {
    draft_.header_bindings_.push_back({std::move(name), std::move(arg_name), ""});
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::HeaderConstant(std::string name,
                                                                       std::string value) {
    draft_.header_bindings_.push_back({std::move(name), std::nullopt, std::move(value)});
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Body(std::string arg_name) {
    draft_.body_arg_ = std::move(arg_name);
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Expect(std::initializer_list<int> statuses) {
    draft_.expected_statuses_.insert(statuses.begin(), statuses.end());
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Expect(int status) {
    draft_.expected_statuses_.insert(status);
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::Returns(ReturnShape shape) {
    draft_.return_shape_ = shape;
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::SuccessBody(BodyShape shape) {
    draft_.success_body_ = std::move(shape);
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::TypedSuccessBody(ValueShape shape) {
    draft_.success_body_ = BodyShape{BodyKind::Typed, std::move(shape)};
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::ErrorKind(std::string kind_name,
                                                                  ErrorFactory factory) {
    draft_.error_kind_name_ = std::move(kind_name);
    draft_.error_factory_ = std::move(factory);
    return *this;
}

OperationDescriptorBuilder& OperationDescriptorBuilder::ErrorBody(ValueShape shape) {
    draft_.error_body_ = std::move(shape);
    return *this;
}

Result<OperationDescriptorPtr, Error> OperationDescriptorBuilder::Build() const {
    const auto& name = draft_.name_;
    auto fail = [&](const std::string& message) {
        return Result<OperationDescriptorPtr, Error>::Err(
            MakeDescriptorError(name.empty() ? "OperationDescriptorBuilder" : name,
                                message));
    };

    if (name.empty()) {
        return fail("operation name is empty");
    }
    if (std::find(kMethods.begin(), kMethods.end(), draft_.method_) == kMethods.end()) {
        return fail("unsupported HTTP method '" + draft_.method_ + "'");
    }
    if (draft_.scheme_.empty()) {
        return fail("scheme is empty");
    }
    if (draft_.host_.empty()) {
        return fail("host is empty");
    }
    for (int status : draft_.expected_statuses_) {
        if (status < 100 || status > 599) {
            return fail("expected status " + std::to_string(status) + " is not an HTTP status");
        }
    }
    if (!draft_.error_factory_) {
        return fail("error kind '" + draft_.error_kind_name_ + "' has no factory");
    }

    struct TemplateCheck {
        const std::string* tmpl;
        const std::vector<SubstitutionBinding>* bindings;
    };
    const std::vector<SubstitutionBinding> no_bindings;
    for (const auto& check : {TemplateCheck{&draft_.scheme_, &no_bindings},
                              TemplateCheck{&draft_.host_, &draft_.host_bindings_},
                              TemplateCheck{&draft_.path_, &draft_.path_bindings_}}) {
        auto placeholders = Placeholders(*check.tmpl);
        if (placeholders.IsErr()) {
            return fail(placeholders.Error());
        }
        for (const auto& binding : *check.bindings) {
            const auto& names = placeholders.Value();
            if (std::find(names.begin(), names.end(), binding.placeholder) == names.end()) {
                return fail("binding for '{" + binding.placeholder +
                            "}' has no placeholder in '" + *check.tmpl + "'");
            }
        }
    }
    for (const auto& binding : draft_.query_bindings_) {
        if (binding.name.empty()) {
            return fail("query parameter with empty name");
        }
    }
    for (const auto& binding : draft_.header_bindings_) {
        if (binding.name.empty()) {
            return fail("header with empty name");
        }
    }

    auto descriptor = std::make_shared<OperationDescriptor>(draft_);
    if (descriptor->IsHead() ||
        descriptor->return_shape_ == ReturnShape::FireAndForget ||
        descriptor->return_shape_ == ReturnShape::DeferredCompletion) {
        descriptor->success_body_ = BodyShape{};
    }
    return Result<OperationDescriptorPtr, Error>::Ok(std::move(descriptor));
}

} // namespace restcall
