#include <restcall/codec/json_codec.hpp>

namespace restcall {

namespace {

Error MakeCodecError(const std::string& operation, const std::string& message) {
    return Error::Make(operation, "", message, ErrorCategory::Serialization);
}

bool MatchesKind(const nlohmann::json& value, JsonKind kind) {
    switch (kind) {
        case JsonKind::Any:     return true;
        case JsonKind::Object:  return value.is_object();
        case JsonKind::Array:   return value.is_array();
        case JsonKind::String:  return value.is_string();
        case JsonKind::Number:  return value.is_number();
        case JsonKind::Boolean: return value.is_boolean();
    }
    return false;
}

} // anonymous namespace

std::string JsonKindName(JsonKind kind) {
    switch (kind) {
        case JsonKind::Any:     return "any";
        case JsonKind::Object:  return "object";
        case JsonKind::Array:   return "array";
        case JsonKind::String:  return "string";
        case JsonKind::Number:  return "number";
        case JsonKind::Boolean: return "boolean";
    }
    return "any";
}

Result<void, Error> CheckShape(const nlohmann::json& value, const ValueShape& shape) {
    if (value.is_null()) {
        return Result<void, Error>::Ok();
    }
    if (!MatchesKind(value, shape.kind)) {
        return Result<void, Error>::Err(MakeCodecError(
            "Deserialize",
            "cannot decode " + std::string(value.type_name()) + " into " +
                shape.type_name + " (expected " + JsonKindName(shape.kind) + ")"));
    }
    if (shape.kind == JsonKind::Object) {
        for (const auto& field : shape.required_fields) {
            if (!value.contains(field)) {
                return Result<void, Error>::Err(MakeCodecError(
                    "Deserialize",
                    shape.type_name + " is missing required field '" + field + "'"));
            }
        }
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> JsonCodec::Serialize(const nlohmann::json& value) const {
    try {
        return Result<std::string, Error>::Ok(value.dump());
    } catch (const nlohmann::json::type_error& e) {
        // Thrown for strings that are not valid UTF-8.
        return Result<std::string, Error>::Err(
            MakeCodecError("Serialize", e.what()));
    }
}

Result<nlohmann::json, Error> JsonCodec::Deserialize(std::string_view text,
                                                     const ValueShape& shape) const {
    if (text.empty()) {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json());
    }

    nlohmann::json value;
    try {
        value = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(MakeCodecError(
            "Deserialize", "malformed JSON for " + shape.type_name + ": " + e.what()));
    }

    auto check = CheckShape(value, shape);
    if (check.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(check).Error());
    }
    return Result<nlohmann::json, Error>::Ok(std::move(value));
}

} // namespace restcall
