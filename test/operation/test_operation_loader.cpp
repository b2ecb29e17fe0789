#include <catch2/catch_test_macros.hpp>

#include <restcall/operation/operation_loader.hpp>

#include <string>

using namespace restcall;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));
    return test_root + "/testdata/" + filename;
}

class WidgetError : public ServiceError {
public:
    using ServiceError::ServiceError;
    std::string KindName() const override { return "WidgetError"; }
};

ErrorKindRegistry WidgetErrorKinds() {
    ErrorKindRegistry kinds;
    kinds.Register<WidgetError>("WidgetError");
    return kinds;
}

} // anonymous namespace

// ===========================================================================
// LoadOperationsFromYaml
// ===========================================================================

TEST_CASE("LoadOperationsFromYaml: full operations file", "[operation][yaml]") {
    auto result = LoadOperationsFromYaml(TestDataPath("operations.yaml"), WidgetErrorKinds());
    REQUIRE(result.IsOk());
    const auto& registry = result.Value();
    CHECK(registry.Size() == 5);

    auto get = registry.Find("Widgets.get").Value();
    CHECK(get->Method() == "GET");
    CHECK(get->SchemeTemplate() == "https");
    CHECK(get->HostTemplate() == "{endpoint}");
    CHECK(get->ExpectedStatuses() == std::set<int>{200});
    CHECK(get->SuccessBody().kind == BodyKind::Typed);
    CHECK(get->SuccessBody().value.type_name == "Widget");
    CHECK(get->SuccessBody().value.kind == JsonKind::Object);
    CHECK(get->SuccessBody().value.required_fields == std::vector<std::string>{"id"});
    CHECK(get->ErrorKindName() == "WidgetError");
    CHECK(get->ErrorBody().type_name == "WidgetErrorBody");
    REQUIRE(get->QueryBindings().size() == 1);
    CHECK(get->QueryBindings()[0].constant_value == "2024-01-01");
    REQUIRE(get->HeaderBindings().size() == 1);
    CHECK(get->HeaderBindings()[0].arg_name == std::optional<std::string>("requestId"));
}

TEST_CASE("LoadOperationsFromYaml: return shapes and body kinds", "[operation][yaml]") {
    auto result = LoadOperationsFromYaml(TestDataPath("operations.yaml"), WidgetErrorKinds());
    REQUIRE(result.IsOk());
    const auto& registry = result.Value();

    auto create = registry.Find("Widgets.create").Value();
    CHECK(create->Returns() == ReturnShape::DeferredValue);
    CHECK(create->SuccessBody().kind == BodyKind::Typed);
    CHECK(create->BodyArgument() == std::optional<std::string>("widget"));

    auto del = registry.Find("Widgets.delete").Value();
    CHECK(del->Returns() == ReturnShape::DeferredCompletion);
    CHECK(del->SuccessBody().kind == BodyKind::None);

    auto exists = registry.Find("Widgets.exists").Value();
    CHECK(exists->IsHead());
    CHECK(exists->Returns() == ReturnShape::FireAndForget);

    auto download = registry.Find("Blobs.download").Value();
    CHECK(download->SchemeTemplate() == "http");
    CHECK(download->SuccessBody().kind == BodyKind::RawBytes);
    CallArgs args = {{"accountName", "acct"}, {"container", "c 1"}, {"blobPath", "a%2Fb"}};
    CHECK(download->ResolveHost(args).Value() == "acct.blob.example.com");
    CHECK(download->ResolvePath(args).Value() == "/c%201/a%2Fb");
}

TEST_CASE("LoadOperationsFromYaml: nonexistent file", "[operation][yaml]") {
    auto result = LoadOperationsFromYaml("/nonexistent/operations.yaml", ErrorKindRegistry());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

TEST_CASE("LoadOperationsFromYaml: invalid template is reported", "[operation][yaml]") {
    auto result = LoadOperationsFromYaml(TestDataPath("invalid_operations.yaml"),
                                         ErrorKindRegistry());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("unterminated placeholder") != std::string::npos);
}

// ===========================================================================
// LoadOperationsFromYamlString
// ===========================================================================

TEST_CASE("LoadOperationsFromYamlString: unknown error kind", "[operation][yaml]") {
    auto result = LoadOperationsFromYamlString(R"(
operations:
  - name: Widgets.get
    host: example.com
    error: {kind: WidgetError}
)", ErrorKindRegistry());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message ==
          "operation 'Widgets.get': unknown error kind 'WidgetError'");
}

TEST_CASE("LoadOperationsFromYamlString: missing operations list", "[operation][yaml]") {
    auto result = LoadOperationsFromYamlString("defaults: {host: example.com}\n",
                                               ErrorKindRegistry());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "missing 'operations' list");
}

TEST_CASE("LoadOperationsFromYamlString: duplicate operation names", "[operation][yaml]") {
    auto result = LoadOperationsFromYamlString(R"(
defaults: {host: example.com}
operations:
  - name: Widgets.get
  - name: Widgets.get
)", ErrorKindRegistry());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

TEST_CASE("LoadOperationsFromYamlString: bad return shape and body kind", "[operation][yaml]") {
    auto shape = LoadOperationsFromYamlString(R"(
operations:
  - {name: Op, host: example.com, returns: eventually}
)", ErrorKindRegistry());
    REQUIRE(shape.IsErr());
    CHECK(shape.Error().message.find("unknown return shape 'eventually'") != std::string::npos);

    auto body = LoadOperationsFromYamlString(R"(
operations:
  - name: Op
    host: example.com
    success_body: {kind: typed, json: tuple}
)", ErrorKindRegistry());
    REQUIRE(body.IsErr());
    CHECK(body.Error().message.find("unknown JSON kind 'tuple'") != std::string::npos);
}

TEST_CASE("LoadOperationsFromYamlString: query entries need arg or value", "[operation][yaml]") {
    auto result = LoadOperationsFromYamlString(R"(
operations:
  - name: Op
    host: example.com
    query:
      - {name: filter}
)", ErrorKindRegistry());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "operation 'Op': query 'filter' needs 'arg' or 'value'");
}

TEST_CASE("LoadOperationsFromYamlString: malformed YAML", "[operation][yaml]") {
    auto result = LoadOperationsFromYamlString("operations: [\n", ErrorKindRegistry());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("failed to parse operations") != std::string::npos);
}
