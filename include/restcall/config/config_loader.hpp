#pragma once

#include <restcall/config/app_config.hpp>
#include <restcall/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace restcall {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments into an AppConfig. `--config` is reported through
// `config_file` so the caller can load and merge it.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv,
                                     std::optional<std::string>* config_file = nullptr);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Call arguments are merged key by key.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Parse one `name=value` call argument. The value is taken as JSON when it
// parses, otherwise as a plain string.
Result<std::pair<std::string, nlohmann::json>, Error> ParseCallArgument(std::string_view text);

} // namespace restcall
