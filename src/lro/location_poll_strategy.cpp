#include <restcall/lro/location_poll_strategy.hpp>
#include <restcall/core/log.hpp>
#include <restcall/core/url.hpp>

namespace restcall {

namespace {

bool IsHttpUrl(std::string_view value) {
    return StartsWithIgnoreCase(value, "http://") || StartsWithIgnoreCase(value, "https://");
}

} // anonymous namespace

LocationPollStrategy::LocationPollStrategy(PrivateTag, PollContext context,
                                           std::string poll_url,
                                           std::chrono::milliseconds delay)
    : PollStrategy(std::move(context), std::move(poll_url), delay) {}

PollStrategyPtr LocationPollStrategy::TryCreate(const PollContext& context,
                                                const HttpRequest& original_request,
                                                const HttpResponse& initial_response,
                                                std::chrono::milliseconds delay) {
    auto location = initial_response.HeaderValue(kHeaderName);
    if (!location.has_value() || location->empty()) {
        return nullptr;
    }

    std::string poll_url;
    if ((*location)[0] == '/') {
        auto resolved = ResolveUrl(original_request.url, *location);
        if (resolved.IsErr()) {
            LogDebug("lro", "Location '" + *location + "' does not resolve against " +
                                original_request.url + ": " + resolved.Error().message);
            return nullptr;
        }
        poll_url = std::move(resolved).Value();
    } else if (IsHttpUrl(*location)) {
        poll_url = *location;
    } else {
        return nullptr;
    }

    LogDebug("lro", context.operation_name + ": polling Location " + poll_url);
    return std::make_unique<LocationPollStrategy>(PrivateTag{}, context, std::move(poll_url),
                                                  delay);
}

Result<HttpResponse, Error> LocationPollStrategy::UpdateFrom(HttpResponse response) {
    if (IsDone()) {
        return Result<HttpResponse, Error>::Err(MakePollError(
            "poll response received after the operation completed", ErrorCategory::Internal));
    }

    auto expected = EnsureExpectedStatus(response, {202});
    if (expected.IsErr()) {
        return Result<HttpResponse, Error>::Err(std::move(expected).Error());
    }

    UpdateDelayFrom(response);

    if (response.status_code == 202) {
        auto location = response.HeaderValue(kHeaderName);
        if (location.has_value() && !location->empty()) {
            if (IsHttpUrl(*location)) {
                SetPollUrl(*location);
            } else {
                auto resolved = ResolveUrl(PollUrl(), *location);
                if (resolved.IsOk() && IsHttpUrl(resolved.Value())) {
                    SetPollUrl(std::move(resolved).Value());
                } else {
                    LogDebug("lro", "ignoring Location '" + *location + "'");
                }
            }
        }
    } else {
        MarkDone();
    }
    return Result<HttpResponse, Error>::Ok(std::move(response));
}

} // namespace restcall
