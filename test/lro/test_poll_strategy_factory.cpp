#include <catch2/catch_test_macros.hpp>

#include <restcall/lro/location_poll_strategy.hpp>
#include <restcall/lro/poll_strategy_factory.hpp>

#include <chrono>

using namespace restcall;
using namespace std::chrono_literals;

namespace {

// Claims every operation and polls a fixed URL.
class FixedUrlStrategy : public PollStrategy {
public:
    FixedUrlStrategy(const PollContext& context, std::chrono::milliseconds delay)
        : PollStrategy(context, "https://fixed/status", delay) {}

    Result<HttpResponse, Error> UpdateFrom(HttpResponse response) override {
        MarkDone();
        return Result<HttpResponse, Error>::Ok(std::move(response));
    }
};

PollStrategyPtr ClaimAll(const PollContext& context, const HttpRequest&,
                         const HttpResponse&, std::chrono::milliseconds delay) {
    return PollStrategyPtr(new FixedUrlStrategy(context, delay));
}

PollStrategyPtr DeclineAll(const PollContext&, const HttpRequest&, const HttpResponse&,
                           std::chrono::milliseconds) {
    return nullptr;
}

const PollContext kContext{"Widgets.create", {200}};

HttpRequest Request() {
    HttpRequest request;
    request.method = "PUT";
    request.url = "https://host/widgets/1";
    return request;
}

HttpResponse Accepted(HttpHeaders headers) {
    HttpResponse response;
    response.status_code = 202;
    response.headers = std::move(headers);
    return response;
}

} // anonymous namespace

TEST_CASE("SelectPollStrategy: default chain picks Location", "[lro][factory]") {
    auto strategy = SelectPollStrategy(DefaultPollStrategyFactories(), kContext, Request(),
                                       Accepted({{"Location", "/ops/1"}}), 10ms);
    REQUIRE(strategy != nullptr);
    CHECK(dynamic_cast<LocationPollStrategy*>(strategy.get()) != nullptr);
    CHECK(strategy->PollUrl() == "https://host/ops/1");
}

TEST_CASE("SelectPollStrategy: nothing claims a plain response", "[lro][factory]") {
    HttpResponse ok;
    ok.status_code = 200;
    CHECK(SelectPollStrategy(DefaultPollStrategyFactories(), kContext, Request(), ok, 10ms) ==
          nullptr);
    CHECK(SelectPollStrategy({}, kContext, Request(), ok, 10ms) == nullptr);
}

TEST_CASE("SelectPollStrategy: first claiming factory wins", "[lro][factory]") {
    std::vector<PollStrategyFactory> factories = {&DeclineAll, &ClaimAll,
                                                  &LocationPollStrategy::TryCreate};
    auto strategy = SelectPollStrategy(factories, kContext, Request(),
                                       Accepted({{"Location", "/ops/1"}}), 10ms);
    REQUIRE(strategy != nullptr);
    CHECK(strategy->PollUrl() == "https://fixed/status");
}

TEST_CASE("SelectPollStrategy: empty factory slots are skipped", "[lro][factory]") {
    std::vector<PollStrategyFactory> factories = {PollStrategyFactory{},
                                                  &LocationPollStrategy::TryCreate};
    auto strategy = SelectPollStrategy(factories, kContext, Request(),
                                       Accepted({{"Location", "/ops/1"}}), 10ms);
    REQUIRE(strategy != nullptr);
    CHECK(strategy->PollUrl() == "https://host/ops/1");
}
