#include <catch2/catch_test_macros.hpp>

#include <restcall/core/log.hpp>
#include <restcall/http/http_transport.hpp>
#include "../../test/mocks/local_server.hpp"

#include <httplib.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

using namespace restcall;
using namespace restcall::testing;

namespace {

HttpTransport MakeTestTransport() {
    HttpTransportOptions options;
    options.connect_timeout = std::chrono::seconds{5};
    options.read_timeout = std::chrono::seconds{5};
    return HttpTransport(options);
}

HttpRequest MakeRequest(std::string method, std::string url) {
    HttpRequest request;
    request.operation_name = "Test.op";
    request.method = std::move(method);
    request.url = std::move(url);
    return request;
}

// Routes the global logger into a stream for one test, then silences it.
class ScopedLogCapture {
public:
    explicit ScopedLogCapture(LogLevel level) {
        InitGlobalLogger(std::make_unique<JsonSink>(out_), level);
    }
    ~ScopedLogCapture() {
        static std::ostringstream discarded;
        InitGlobalLogger(std::make_unique<JsonSink>(discarded), LogLevel::Error);
    }
    std::string Text() const { return out_.str(); }

private:
    std::ostringstream out_;
};

} // anonymous namespace

TEST_CASE("HttpTransport: GET returns status, headers and body", "[http][transport]") {
    httplib::Server svr;
    svr.Get("/widgets/1", [](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Location", "/operations/9");
        res.set_content(R"({"id":"1","q":")" + req.get_param_value("q") + "\"}",
                        "application/json");
    });
    LocalServer server(svr);

    auto transport = MakeTestTransport();
    auto result = transport.Send(MakeRequest("GET", server.BaseUrl() + "/widgets/1?q=a%20b"));
    REQUIRE(result.IsOk());
    const auto& response = result.Value();
    CHECK(response.status_code == 200);
    CHECK(response.HeaderValue("Location") == std::optional<std::string>("/operations/9"));
    CHECK(response.body == R"({"id":"1","q":"a b"})");
}

TEST_CASE("HttpTransport: POST sends body, content type and headers", "[http][transport]") {
    std::string received_body;
    std::string received_type;
    std::string received_header;
    httplib::Server svr;
    svr.Post("/widgets", [&](const httplib::Request& req, httplib::Response& res) {
        received_body = req.body;
        received_type = req.get_header_value("Content-Type");
        received_header = req.get_header_value("x-client-name");
        res.status = 201;
    });
    LocalServer server(svr);

    auto request = MakeRequest("POST", server.BaseUrl() + "/widgets");
    request.WithHeader("x-client-name", "restcall").WithBody(R"({"name":"w"})", "application/json");

    auto transport = MakeTestTransport();
    auto result = transport.Send(request);
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 201);
    CHECK(received_body == R"({"name":"w"})");
    CHECK(received_type == "application/json");
    CHECK(received_header == "restcall");
}

TEST_CASE("HttpTransport: error statuses are successful sends", "[http][transport]") {
    httplib::Server svr;
    svr.Delete("/widgets/1", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content(R"({"code":"NotFound"})", "application/json");
    });
    LocalServer server(svr);

    auto transport = MakeTestTransport();
    auto result = transport.Send(MakeRequest("DELETE", server.BaseUrl() + "/widgets/1"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 404);
    CHECK(result.Value().body == R"({"code":"NotFound"})");
}

TEST_CASE("HttpTransport: SendAsync delivers the same response", "[http][transport]") {
    httplib::Server svr;
    svr.Get("/ping", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("pong", "text/plain");
    });
    LocalServer server(svr);

    auto transport = MakeTestTransport();
    auto future = transport.SendAsync(MakeRequest("GET", server.BaseUrl() + "/ping"));
    auto result = future.get();
    REQUIRE(result.IsOk());
    CHECK(result.Value().body == "pong");
}

TEST_CASE("HttpTransport: connection refused is a transport error", "[http][transport]") {
    int port = 0;
    {
        httplib::Server svr;
        LocalServer server(svr);
        port = server.Port();
    }

    auto transport = MakeTestTransport();
    auto result = transport.Send(MakeRequest("GET", "http://127.0.0.1:" + std::to_string(port) + "/"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Transport);
    CHECK(result.Error().operation == "Test.op");
}

TEST_CASE("HttpTransport: rejects relative and non-http URLs", "[http][transport]") {
    auto transport = MakeTestTransport();

    auto relative = transport.Send(MakeRequest("GET", "/widgets"));
    REQUIRE(relative.IsErr());
    CHECK(relative.Error().category == ErrorCategory::InvalidArgument);

    auto ftp = transport.Send(MakeRequest("GET", "ftp://host/file"));
    REQUIRE(ftp.IsErr());
    CHECK(ftp.Error().category == ErrorCategory::InvalidArgument);
}

TEST_CASE("HttpTransport: header lines are logged only at debug level", "[http][transport][log]") {
    httplib::Server svr;
    svr.Get("/widgets/1", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Set-Cookie", "session=abc");
        res.set_content("{}", "application/json");
    });
    LocalServer server(svr);
    auto transport = MakeTestTransport();

    SECTION("info level logs the request line and status only") {
        ScopedLogCapture capture(LogLevel::Info);
        auto request = MakeRequest("GET", server.BaseUrl() + "/widgets/1");
        request.WithHeader("Authorization", "Bearer secret");
        REQUIRE(transport.Send(request).IsOk());
        auto text = capture.Text();
        CHECK(text.find("GET " + server.BaseUrl() + "/widgets/1") != std::string::npos);
        CHECK(text.find("  < 200") != std::string::npos);
        CHECK(text.find("  > ") == std::string::npos);
        CHECK(text.find("Set-Cookie") == std::string::npos);
    }

    SECTION("debug level logs headers with secrets redacted") {
        ScopedLogCapture capture(LogLevel::Debug);
        auto request = MakeRequest("GET", server.BaseUrl() + "/widgets/1");
        request.WithHeader("Authorization", "Bearer secret");
        REQUIRE(transport.Send(request).IsOk());
        auto text = capture.Text();
        CHECK(text.find("  > Authorization: <redacted>") != std::string::npos);
        CHECK(text.find("Set-Cookie: <redacted>") != std::string::npos);
        CHECK(text.find("secret") == std::string::npos);
        CHECK(text.find("session=abc") == std::string::npos);
    }
}
