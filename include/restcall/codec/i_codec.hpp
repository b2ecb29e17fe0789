#pragma once

#include <restcall/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace restcall {

// ---------------------------------------------------------------------------
// JsonKind / ValueShape — the declared shape a typed body must decode into.
// ---------------------------------------------------------------------------
enum class JsonKind {
    Any,
    Object,
    Array,
    String,
    Number,
    Boolean,
};

std::string JsonKindName(JsonKind kind);

struct ValueShape {
    std::string type_name = "any";
    JsonKind kind = JsonKind::Any;
    // Only checked when kind is Object.
    std::vector<std::string> required_fields;
};

// ---------------------------------------------------------------------------
// ICodec — abstract body codec.
//
// Both directions are fallible and report ErrorCategory::Serialization.
// Deserializing an empty text yields a JSON null for any shape.
// ---------------------------------------------------------------------------
class ICodec {
public:
    virtual ~ICodec() = default;

    ICodec(const ICodec&) = delete;
    ICodec& operator=(const ICodec&) = delete;
    ICodec(ICodec&&) = delete;
    ICodec& operator=(ICodec&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> Serialize(
        const nlohmann::json& value) const = 0;

    [[nodiscard]] virtual Result<nlohmann::json, Error> Deserialize(
        std::string_view text, const ValueShape& shape) const = 0;

protected:
    ICodec() = default;
};

} // namespace restcall
