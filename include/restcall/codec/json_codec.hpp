#pragma once

#include <restcall/codec/i_codec.hpp>

namespace restcall {

// ---------------------------------------------------------------------------
// JsonCodec — ICodec implementation backed by nlohmann/json.
// ---------------------------------------------------------------------------
class JsonCodec : public ICodec {
public:
    JsonCodec() = default;

    [[nodiscard]] Result<std::string, Error> Serialize(
        const nlohmann::json& value) const override;

    [[nodiscard]] Result<nlohmann::json, Error> Deserialize(
        std::string_view text, const ValueShape& shape) const override;
};

// Check a decoded value against a declared shape. Null always conforms.
Result<void, Error> CheckShape(const nlohmann::json& value, const ValueShape& shape);

} // namespace restcall
