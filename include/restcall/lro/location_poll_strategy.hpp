#pragma once

#include <restcall/lro/poll_strategy.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace restcall {

// ---------------------------------------------------------------------------
// LocationPollStrategy — polls the URL named by the Location header.
//
// 202 keeps polling and may move the poll URL; any other accepted status
// ends the operation. The Location lookup is exact and case-sensitive.
// ---------------------------------------------------------------------------
class LocationPollStrategy final : public PollStrategy {
    // Restricts construction to TryCreate while keeping make_unique usable.
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static constexpr std::string_view kHeaderName = "Location";

    // Returns nullptr (declines) when the initial response has no usable
    // Location header.
    static PollStrategyPtr TryCreate(const PollContext& context,
                                     const HttpRequest& original_request,
                                     const HttpResponse& initial_response,
                                     std::chrono::milliseconds delay);

    LocationPollStrategy(PrivateTag, PollContext context, std::string poll_url,
                         std::chrono::milliseconds delay);

    [[nodiscard]] Result<HttpResponse, Error> UpdateFrom(HttpResponse response) override;
};

} // namespace restcall
