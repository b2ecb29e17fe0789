#include <restcall/lro/poll_strategy_factory.hpp>
#include <restcall/lro/location_poll_strategy.hpp>

namespace restcall {

PollStrategyPtr SelectPollStrategy(const std::vector<PollStrategyFactory>& factories,
                                   const PollContext& context,
                                   const HttpRequest& original_request,
                                   const HttpResponse& initial_response,
                                   std::chrono::milliseconds delay) {
    for (const auto& factory : factories) {
        if (!factory) {
            continue;
        }
        if (auto strategy = factory(context, original_request, initial_response, delay)) {
            return strategy;
        }
    }
    return nullptr;
}

std::vector<PollStrategyFactory> DefaultPollStrategyFactories() {
    return {&LocationPollStrategy::TryCreate};
}

} // namespace restcall
