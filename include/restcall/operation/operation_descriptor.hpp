#pragma once

#include <restcall/codec/i_codec.hpp>
#include <restcall/core/result.hpp>
#include <restcall/http/http_types.hpp>
#include <restcall/operation/service_error.hpp>

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace restcall {

// Call arguments: a JSON object keyed by parameter name.
using CallArgs = nlohmann::json;

// ---------------------------------------------------------------------------
// ReturnShape — how an invocation delivers its result. Fixed per operation.
// ---------------------------------------------------------------------------
enum class ReturnShape {
    FireAndForget,       // blocking send, result is always null
    DeferredValue,       // future of exactly one decoded value
    DeferredCompletion,  // future of a completion signal, no value
    BlockingValue,       // blocking send, decoded value returned directly
};

std::string ReturnShapeName(ReturnShape shape);
Result<ReturnShape, Error> ParseReturnShape(std::string_view name);

// ---------------------------------------------------------------------------
// BodyShape — how a success body is decoded.
// ---------------------------------------------------------------------------
enum class BodyKind {
    None,       // null
    RawStream,  // stream over the undecoded body
    RawBytes,   // full body as a byte buffer
    Typed,      // body text decoded through the codec into `value`
};

std::string BodyKindName(BodyKind kind);
Result<BodyKind, Error> ParseBodyKind(std::string_view name);

struct BodyShape {
    BodyKind kind = BodyKind::None;
    ValueShape value;
};

// ---------------------------------------------------------------------------
// Parameter bindings.
// ---------------------------------------------------------------------------

// `{placeholder}` in the host or path template, filled from `arg_name`.
struct SubstitutionBinding {
    std::string placeholder;
    std::string arg_name;
    bool already_encoded = false;
};

// Query parameter from an argument, or a constant when arg_name is empty.
struct QueryBinding {
    std::string name;
    std::optional<std::string> arg_name;
    std::string constant_value;
    bool already_encoded = false;
};

// Header from an argument, or a constant when arg_name is empty.
struct HeaderBinding {
    std::string name;
    std::optional<std::string> arg_name;
    std::string constant_value;
};

// Render an argument for a URL or header: strings verbatim, other scalars
// as their JSON text. Absent or null arguments yield nullopt.
std::optional<std::string> ArgumentText(const CallArgs& args, const std::string& name);

// ---------------------------------------------------------------------------
// OperationDescriptor — immutable metadata for one declared remote
// operation. Built by OperationDescriptorBuilder and shared read-only.
// ---------------------------------------------------------------------------
class OperationDescriptor {
public:
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] const std::string& Method() const noexcept { return method_; }
    [[nodiscard]] const std::string& SchemeTemplate() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& HostTemplate() const noexcept { return host_; }
    [[nodiscard]] const std::string& PathTemplate() const noexcept { return path_; }
    [[nodiscard]] const std::vector<SubstitutionBinding>& HostBindings() const noexcept { return host_bindings_; }
    [[nodiscard]] const std::vector<SubstitutionBinding>& PathBindings() const noexcept { return path_bindings_; }
    [[nodiscard]] const std::vector<QueryBinding>& QueryBindings() const noexcept { return query_bindings_; }
    [[nodiscard]] const std::vector<HeaderBinding>& HeaderBindings() const noexcept { return header_bindings_; }
    [[nodiscard]] const std::optional<std::string>& BodyArgument() const noexcept { return body_arg_; }
    [[nodiscard]] const std::set<int>& ExpectedStatuses() const noexcept { return expected_statuses_; }
    [[nodiscard]] ReturnShape Returns() const noexcept { return return_shape_; }
    [[nodiscard]] const BodyShape& SuccessBody() const noexcept { return success_body_; }
    [[nodiscard]] const std::string& ErrorKindName() const noexcept { return error_kind_name_; }
    [[nodiscard]] const ErrorFactory& MakeError() const noexcept { return error_factory_; }
    [[nodiscard]] const ValueShape& ErrorBody() const noexcept { return error_body_; }

    [[nodiscard]] bool IsHead() const { return method_ == "HEAD"; }

    // An empty expected set accepts any status below 400.
    [[nodiscard]] bool IsExpectedStatus(int status) const;
    [[nodiscard]] bool IsExpectedStatus(int status, std::initializer_list<int> additional) const;

    // -- Resolution against call arguments -----------------------------------

    [[nodiscard]] Result<std::string, Error> ResolveScheme(const CallArgs& args) const;
    [[nodiscard]] Result<std::string, Error> ResolveHost(const CallArgs& args) const;
    [[nodiscard]] Result<std::string, Error> ResolvePath(const CallArgs& args) const;
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> EncodedQueryParameters(
        const CallArgs& args) const;
    [[nodiscard]] HttpHeaders Headers(const CallArgs& args) const;
    [[nodiscard]] std::optional<nlohmann::json> Body(const CallArgs& args) const;

private:
    friend class OperationDescriptorBuilder;
    OperationDescriptor() = default;

    std::string name_;
    std::string method_ = "GET";
    std::string scheme_ = "https";
    std::string host_;
    std::string path_;
    std::vector<SubstitutionBinding> host_bindings_;
    std::vector<SubstitutionBinding> path_bindings_;
    std::vector<QueryBinding> query_bindings_;
    std::vector<HeaderBinding> header_bindings_;
    std::optional<std::string> body_arg_;
    std::set<int> expected_statuses_;
    ReturnShape return_shape_ = ReturnShape::BlockingValue;
    BodyShape success_body_;
    std::string error_kind_name_ = "ServiceError";
    ErrorFactory error_factory_;
    ValueShape error_body_;
};

using OperationDescriptorPtr = std::shared_ptr<const OperationDescriptor>;

// ---------------------------------------------------------------------------
// OperationDescriptorBuilder — fluent construction with validation in Build().
//
// Placeholders without an explicit binding are bound to the argument of the
// same name. Build() forces the success body to BodyKind::None for HEAD and
// for the FireAndForget / DeferredCompletion shapes.
// ---------------------------------------------------------------------------
class OperationDescriptorBuilder {
public:
    explicit OperationDescriptorBuilder(std::string name);

    OperationDescriptorBuilder& Method(std::string method);
    OperationDescriptorBuilder& Scheme(std::string scheme_template);
    OperationDescriptorBuilder& Host(std::string host_template);
    OperationDescriptorBuilder& Path(std::string path_template);
    OperationDescriptorBuilder& HostParam(std::string placeholder, std::string arg_name);
    OperationDescriptorBuilder& PathParam(std::string placeholder, std::string arg_name,
                                          bool already_encoded = false);
    OperationDescriptorBuilder& Query(std::string name, std::string arg_name,
                                      bool already_encoded = false);
    OperationDescriptorBuilder& QueryConstant(std::string name, std::string value);
    OperationDescriptorBuilder& Header(std::string name, std::string arg_name);
    OperationDescriptorBuilder& HeaderConstant(std::string name, std::string value);
    OperationDescriptorBuilder& Body(std::string arg_name);
    OperationDescriptorBuilder& Expect(std::initializer_list<int> statuses);
    OperationDescriptorBuilder& Expect(int status);
    OperationDescriptorBuilder& Returns(ReturnShape shape);
    OperationDescriptorBuilder& SuccessBody(BodyShape shape);
    OperationDescriptorBuilder& TypedSuccessBody(ValueShape shape);
    OperationDescriptorBuilder& ErrorKind(std::string kind_name, ErrorFactory factory);
    OperationDescriptorBuilder& ErrorBody(ValueShape shape);

    [[nodiscard]] Result<OperationDescriptorPtr, Error> Build() const;

private:
    OperationDescriptor draft_;
};

} // namespace restcall
