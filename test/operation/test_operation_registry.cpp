#include <catch2/catch_test_macros.hpp>

#include <restcall/operation/operation_registry.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace restcall;

namespace {

OperationDescriptorPtr MakeDescriptor(const std::string& name) {
    OperationDescriptorBuilder builder(name);
    builder.Host("host");
    return builder.Build().Value();
}

class ConflictError : public ServiceError {
public:
    using ServiceError::ServiceError;
    std::string KindName() const override { return "ConflictError"; }
};

} // anonymous namespace

TEST_CASE("OperationRegistry: register and find", "[operation][registry]") {
    OperationRegistry registry;
    REQUIRE(registry.Register(MakeDescriptor("Widgets.get")).IsOk());
    REQUIRE(registry.Register(MakeDescriptor("Widgets.list")).IsOk());

    auto found = registry.Find("Widgets.get");
    REQUIRE(found.IsOk());
    CHECK(found.Value()->Name() == "Widgets.get");
    CHECK(registry.Names() == std::vector<std::string>{"Widgets.get", "Widgets.list"});
}

TEST_CASE("OperationRegistry: unknown name is InvalidArgument", "[operation][registry]") {
    OperationRegistry registry;
    auto found = registry.Find("Nope.nothing");
    REQUIRE(found.IsErr());
    CHECK(found.Error().category == ErrorCategory::InvalidArgument);
}

TEST_CASE("OperationRegistry: duplicate names are rejected", "[operation][registry]") {
    OperationRegistry registry;
    REQUIRE(registry.Register(MakeDescriptor("Widgets.get")).IsOk());
    auto again = registry.Register(MakeDescriptor("Widgets.get"));
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::Configuration);
    CHECK(registry.Size() == 1);
}

TEST_CASE("OperationRegistry: concurrent lookups", "[operation][registry]") {
    OperationRegistry registry;
    REQUIRE(registry.Register(MakeDescriptor("Widgets.get")).IsOk());

    std::vector<std::thread> threads;
    std::vector<int> hits(8, 0);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&registry, &hits, t] {
            for (int i = 0; i < 100; ++i) {
                if (registry.Find("Widgets.get").IsOk()) {
                    ++hits[static_cast<size_t>(t)];
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    for (int count : hits) {
        CHECK(count == 100);
    }
}

TEST_CASE("ErrorKindRegistry: always knows ServiceError", "[operation][registry]") {
    ErrorKindRegistry kinds;
    CHECK(kinds.Find("ServiceError") != nullptr);
    CHECK(kinds.Find("ConflictError") == nullptr);
}

TEST_CASE("ErrorKindRegistry: registered kinds build derived errors", "[operation][registry]") {
    ErrorKindRegistry kinds;
    kinds.Register<ConflictError>("ConflictError");
    const auto* factory = kinds.Find("ConflictError");
    REQUIRE(factory != nullptr);

    HttpResponse response;
    response.status_code = 409;
    auto built = (*factory)("Status code 409, ", response, std::nullopt);
    REQUIRE(built.IsOk());
    CHECK(built.Value()->KindName() == "ConflictError");
    CHECK(built.Value()->StatusCode() == 409);
}
