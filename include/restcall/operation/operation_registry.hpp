#pragma once

#include <restcall/core/result.hpp>
#include <restcall/operation/operation_descriptor.hpp>
#include <restcall/operation/service_error.hpp>

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace restcall {

// ---------------------------------------------------------------------------
// OperationRegistry — maps an operation name to its descriptor.
//
// Thread-safe: lookups take a shared lock, registration an exclusive one.
// ---------------------------------------------------------------------------
class OperationRegistry {
public:
    OperationRegistry() = default;
    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;
    OperationRegistry(OperationRegistry&& other) noexcept;
    OperationRegistry& operator=(OperationRegistry&& other) noexcept;

    // Fails when a descriptor with the same name is already registered.
    Result<void, Error> Register(OperationDescriptorPtr descriptor);

    [[nodiscard]] Result<OperationDescriptorPtr, Error> Find(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> Names() const;
    [[nodiscard]] size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, OperationDescriptorPtr> operations_;
};

// ---------------------------------------------------------------------------
// ErrorKindRegistry — named error factories referenced by operation files.
// The generic "ServiceError" kind is always present.
// ---------------------------------------------------------------------------
class ErrorKindRegistry {
public:
    ErrorKindRegistry();

    void Register(std::string kind_name, ErrorFactory factory);

    template <typename E>
    void Register(std::string kind_name) {
        Register(std::move(kind_name), MakeErrorFactory<E>());
    }

    [[nodiscard]] const ErrorFactory* Find(const std::string& kind_name) const;

private:
    std::map<std::string, ErrorFactory> factories_;
};

} // namespace restcall
