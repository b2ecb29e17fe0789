#include <restcall/operation/operation_registry.hpp>

#include <mutex>

namespace restcall {

OperationRegistry::OperationRegistry(OperationRegistry&& other) noexcept {
    std::unique_lock lock(other.mutex_);
    operations_ = std::move(other.operations_);
}

OperationRegistry& OperationRegistry::operator=(OperationRegistry&& other) noexcept {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        operations_ = std::move(other.operations_);
    }
    return *this;
}

Result<void, Error> OperationRegistry::Register(OperationDescriptorPtr descriptor) {
    if (!descriptor) {
        return Result<void, Error>::Err(Error::Make(
            "OperationRegistry", "", "cannot register a null descriptor",
            ErrorCategory::Internal));
    }
    std::unique_lock lock(mutex_);
    const auto& name = descriptor->Name();
    if (operations_.count(name) > 0) {
        return Result<void, Error>::Err(Error::Make(
            "OperationRegistry", "", "operation '" + name + "' is already registered",
            ErrorCategory::Configuration));
    }
    operations_.emplace(name, std::move(descriptor));
    return Result<void, Error>::Ok();
}

Result<OperationDescriptorPtr, Error> OperationRegistry::Find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = operations_.find(name);
    if (it == operations_.end()) {
        return Result<OperationDescriptorPtr, Error>::Err(Error::Make(
            "OperationRegistry", "", "unknown operation '" + name + "'",
            ErrorCategory::InvalidArgument));
    }
    return Result<OperationDescriptorPtr, Error>::Ok(it->second);
}

std::vector<std::string> OperationRegistry::Names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(operations_.size());
    for (const auto& [name, _] : operations_) {
        names.push_back(name);
    }
    return names;
}

size_t OperationRegistry::Size() const {
    std::shared_lock lock(mutex_);
    return operations_.size();
}

ErrorKindRegistry::ErrorKindRegistry() {
    Register<ServiceError>("ServiceError");
}

void ErrorKindRegistry::Register(std::string kind_name, ErrorFactory factory) {
    factories_[std::move(kind_name)] = std::move(factory);
}

const ErrorFactory* ErrorKindRegistry::Find(const std::string& kind_name) const {
    auto it = factories_.find(kind_name);
    return it == factories_.end() ? nullptr : &it->second;
}

} // namespace restcall
