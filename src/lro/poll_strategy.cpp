#include <restcall/lro/poll_strategy.hpp>
#include <restcall/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace restcall {

PollContext PollContext::For(const OperationDescriptor& descriptor) {
    return PollContext{descriptor.Name(), descriptor.ExpectedStatuses()};
}

bool PollContext::IsTerminal(int status) const {
    if (terminal_statuses.empty()) {
        return status < 400;
    }
    return terminal_statuses.count(status) > 0;
}

std::optional<std::chrono::milliseconds> ParseRetryAfter(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    if (value.empty() || value.size() > 9 ||
        !std::all_of(value.begin(), value.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    long long seconds = 0;
    for (char c : value) {
        seconds = seconds * 10 + (c - '0');
    }
    return std::chrono::milliseconds(seconds * 1000);
}

PollStrategy::PollStrategy(PollContext context, std::string poll_url,
                           std::chrono::milliseconds delay)
    : context_(std::move(context)),
      state_{std::move(poll_url), std::max(delay, std::chrono::milliseconds(0)), false} {}

HttpRequest PollStrategy::CreatePollRequest() const {
    HttpRequest request;
    request.operation_name = context_.operation_name;
    request.method = "GET";
    request.url = state_.poll_url;
    return request;
}

Result<void, Error> PollStrategy::EnsureExpectedStatus(
    const HttpResponse& response, std::initializer_list<int> in_progress) const {
    const int status = response.status_code;
    if (std::find(in_progress.begin(), in_progress.end(), status) != in_progress.end() ||
        context_.IsTerminal(status)) {
        return Result<void, Error>::Ok();
    }

    auto error = MakePollError("unexpected poll response status " + std::to_string(status),
                               ErrorCategory::PollRound, status);
    auto body = response.BodyAsString();
    if (body.IsOk() && !body.Value().empty()) {
        error.response_body = std::move(body).Value();
    }
    return Result<void, Error>::Err(std::move(error));
}

void PollStrategy::UpdateDelayFrom(const HttpResponse& response) {
    auto header = response.HeaderValueCi("Retry-After");
    if (!header.has_value()) {
        return;
    }
    auto delay = ParseRetryAfter(*header);
    if (!delay.has_value()) {
        LogDebug("lro", "ignoring Retry-After value '" + *header + "'");
        return;
    }
    state_.delay = *delay;
}

Error PollStrategy::MakePollError(const std::string& message, ErrorCategory category,
                                  std::optional<int> http_status) const {
    return Error::Make(context_.operation_name, state_.poll_url, message, category,
                       http_status);
}

} // namespace restcall
