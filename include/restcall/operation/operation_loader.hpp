#pragma once

#include <restcall/core/result.hpp>
#include <restcall/operation/operation_registry.hpp>

#include <string_view>

namespace restcall {

// Parse an operations YAML file into a registry of descriptors. Error kinds
// named by operations are looked up in `error_kinds`.
//
//   defaults:
//     scheme: https
//     host: "{endpoint}"
//   operations:
//     - name: Widgets.get
//       method: GET
//       path: /widgets/{id}
//       query:
//         - {name: api-version, value: "2024-01-01"}
//       expected: [200]
//       returns: blocking-value
//       success_body: {kind: typed, type: Widget, json: object, required: [id]}
//       error: {kind: ServiceError, body: {type: ErrorBody, json: object}}
Result<OperationRegistry, Error> LoadOperationsFromYaml(std::string_view file_path,
                                                        const ErrorKindRegistry& error_kinds);

Result<OperationRegistry, Error> LoadOperationsFromYamlString(std::string_view yaml,
                                                              const ErrorKindRegistry& error_kinds);

} // namespace restcall
