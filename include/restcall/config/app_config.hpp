#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace restcall {

struct TransportConfig {
    int connect_timeout_seconds = 30;
    int read_timeout_seconds = 120;
    bool disable_tls_verify = false;
    bool follow_redirects = false;
};

struct PollConfig {
    int initial_delay_ms = 2000;
    std::optional<int> timeout_seconds; // unset: poll until done
};

// One operation call requested on the command line.
struct InvocationConfig {
    std::string operation;
    nlohmann::json args = nlohmann::json::object();
    std::optional<std::string> body_file;
    bool wait = false; // follow a long-running operation to completion
    bool list_operations = false;
};

struct AppConfig {
    TransportConfig transport;
    PollConfig poll;
    std::string operations_file;
    InvocationConfig invocation;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    bool no_color = false;
};

} // namespace restcall
