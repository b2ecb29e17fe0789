#include <restcall/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace restcall {

namespace {

Error MakeUrlError(std::string_view url, const std::string& message) {
    return Error::Make("ParseUrl", std::string(url), message,
                       ErrorCategory::InvalidArgument);
}

bool IsSchemeChar(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '+' || c == '-' || c == '.';
}

// The port, if any, follows the last ':' that is not inside an IPv6 literal.
bool HasValidPort(std::string_view authority) {
    auto at = authority.rfind('@');
    auto host_port = at == std::string_view::npos ? authority
                                                  : authority.substr(at + 1);
    auto bracket = host_port.rfind(']');
    auto colon = host_port.rfind(':');
    if (colon == std::string_view::npos ||
        (bracket != std::string_view::npos && colon < bracket)) {
        return true;
    }
    auto port = host_port.substr(colon + 1);
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return port.size() <= 5;
}

std::string HostOf(std::string_view authority) {
    auto at = authority.rfind('@');
    auto host_port = at == std::string_view::npos ? authority
                                                  : authority.substr(at + 1);
    if (!host_port.empty() && host_port.front() == '[') {
        auto close = host_port.find(']');
        return std::string(host_port.substr(0, close == std::string_view::npos
                                                   ? host_port.size()
                                                   : close + 1));
    }
    return std::string(host_port.substr(0, host_port.find(':')));
}

std::string MergePaths(const UrlParts& base, const std::string& reference_path) {
    if (base.authority.has_value() && base.path.empty()) {
        return "/" + reference_path;
    }
    auto slash = base.path.rfind('/');
    if (slash == std::string::npos) {
        return reference_path;
    }
    return base.path.substr(0, slash + 1) + reference_path;
}

} // anonymous namespace

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

bool StartsWithIgnoreCase(std::string_view value, std::string_view prefix) {
    if (value.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        const auto lc = static_cast<unsigned char>(value[i]);
        const auto rc = static_cast<unsigned char>(prefix[i]);
        if (std::tolower(lc) != std::tolower(rc)) {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// UrlParts
// ---------------------------------------------------------------------------
std::string UrlParts::ToString() const {
    std::string out;
    if (!scheme.empty()) {
        out += scheme;
        out += ':';
    }
    if (authority.has_value()) {
        out += "//";
        out += *authority;
    }
    out += path;
    if (query.has_value()) {
        out += '?';
        out += *query;
    }
    if (fragment.has_value()) {
        out += '#';
        out += *fragment;
    }
    return out;
}

Result<UrlParts, Error> ParseUrlReference(std::string_view reference) {
    for (char c : reference) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7F) {
            return Result<UrlParts, Error>::Err(
                MakeUrlError(reference, "URL contains whitespace or control characters"));
        }
    }

    UrlParts parts;
    std::string_view rest = reference;

    // scheme ":" — only if the first delimiter is ':' and the prefix is a
    // valid scheme name.
    auto delim = rest.find_first_of(":/?#");
    if (delim != std::string_view::npos && delim > 0 && rest[delim] == ':' &&
        std::isalpha(static_cast<unsigned char>(rest[0]))) {
        bool valid = true;
        for (size_t i = 0; i < delim; ++i) {
            if (!IsSchemeChar(rest[i])) {
                valid = false;
                break;
            }
        }
        if (valid) {
            parts.scheme = std::string(rest.substr(0, delim));
            for (auto& c : parts.scheme) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            rest.remove_prefix(delim + 1);
        }
    }

    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        auto end = rest.find_first_of("/?#");
        auto authority = rest.substr(0, end);
        if (!HasValidPort(authority)) {
            return Result<UrlParts, Error>::Err(
                MakeUrlError(reference, "URL has an invalid port"));
        }
        parts.authority = std::string(authority);
        rest.remove_prefix(end == std::string_view::npos ? rest.size() : end);
    }

    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        parts.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        parts.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }
    parts.path = std::string(rest);

    return Result<UrlParts, Error>::Ok(std::move(parts));
}

Result<UrlParts, Error> ParseAbsoluteUrl(std::string_view url) {
    auto parsed = ParseUrlReference(url);
    if (parsed.IsErr()) {
        return parsed;
    }
    const auto& parts = parsed.Value();
    if (parts.scheme.empty()) {
        return Result<UrlParts, Error>::Err(
            MakeUrlError(url, "URL has no scheme"));
    }
    if (!parts.authority.has_value() || HostOf(*parts.authority).empty()) {
        return Result<UrlParts, Error>::Err(
            MakeUrlError(url, "URL has no host"));
    }
    return parsed;
}

std::string RemoveDotSegments(std::string_view path) {
    std::string input(path);
    std::string output;

    while (!input.empty()) {
        if (input.rfind("../", 0) == 0) {
            input.erase(0, 3);
        } else if (input.rfind("./", 0) == 0) {
            input.erase(0, 2);
        } else if (input.rfind("/./", 0) == 0) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (input.rfind("/../", 0) == 0 || input == "/..") {
            input = input.size() == 3 ? "/" : input.substr(3);
            auto last = output.rfind('/');
            output.erase(last == std::string::npos ? 0 : last);
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            auto start = input[0] == '/' ? 1 : 0;
            auto next = input.find('/', start);
            if (next == std::string::npos) {
                next = input.size();
            }
            output += input.substr(0, next);
            input.erase(0, next);
        }
    }
    return output;
}

Result<std::string, Error> ResolveUrl(std::string_view base,
                                      std::string_view reference) {
    auto base_result = ParseAbsoluteUrl(base);
    if (base_result.IsErr()) {
        return Result<std::string, Error>::Err(std::move(base_result).Error());
    }
    auto ref_result = ParseUrlReference(reference);
    if (ref_result.IsErr()) {
        return Result<std::string, Error>::Err(std::move(ref_result).Error());
    }
    const auto& b = base_result.Value();
    const auto& r = ref_result.Value();

    UrlParts target;
    if (!r.scheme.empty()) {
        target.scheme = r.scheme;
        target.authority = r.authority;
        target.path = RemoveDotSegments(r.path);
        target.query = r.query;
    } else {
        if (r.authority.has_value()) {
            target.authority = r.authority;
            target.path = RemoveDotSegments(r.path);
            target.query = r.query;
        } else {
            if (r.path.empty()) {
                target.path = b.path;
                target.query = r.query.has_value() ? r.query : b.query;
            } else {
                if (r.path[0] == '/') {
                    target.path = RemoveDotSegments(r.path);
                } else {
                    target.path = RemoveDotSegments(MergePaths(b, r.path));
                }
                target.query = r.query;
            }
            target.authority = b.authority;
        }
        target.scheme = b.scheme;
    }
    target.fragment = r.fragment;

    if (!target.authority.has_value() || HostOf(*target.authority).empty()) {
        return Result<std::string, Error>::Err(
            MakeUrlError(reference, "resolved URL has no host"));
    }
    return Result<std::string, Error>::Ok(target.ToString());
}

// ---------------------------------------------------------------------------
// UrlBuilder
// ---------------------------------------------------------------------------
UrlBuilder& UrlBuilder::WithScheme(std::string scheme) {
    scheme_ = std::move(scheme);
    return *this;
}

UrlBuilder& UrlBuilder::WithHost(std::string host) {
    host_ = std::move(host);
    return *this;
}

UrlBuilder& UrlBuilder::WithPath(std::string path) {
    path_ = std::move(path);
    return *this;
}

UrlBuilder& UrlBuilder::WithQueryParameter(std::string name,
                                           std::string encoded_value) {
    query_.emplace_back(std::move(name), std::move(encoded_value));
    return *this;
}

std::string UrlBuilder::ToString() const {
    std::string url;
    if (!scheme_.empty()) {
        url += scheme_;
        url += "://";
    }
    url += host_;
    if (!path_.empty() && path_[0] != '/') {
        url += '/';
    }
    url += path_;

    char separator = '?';
    for (const auto& [name, value] : query_) {
        url += separator;
        url += name;
        url += '=';
        url += value;
        separator = '&';
    }
    return url;
}

} // namespace restcall
