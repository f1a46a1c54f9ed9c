#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief One problem found while validating an inbound payload.
 *
 * Serialized as {"type": ..., "loc": [...], "msg": ...} inside error messages.
 * `loc` is the path from the message root: object keys as strings, array
 * indices as integers.
 */
struct ValidationIssue {
    std::string type;
    nlohmann::json loc = nlohmann::json::array();
    std::string msg;
};

namespace IssueType {
inline constexpr const char* JsonInvalid = "json_invalid";
inline constexpr const char* ModelType = "model_type";
inline constexpr const char* MissingDiscriminator = "missing_discriminator";
inline constexpr const char* UnknownDiscriminator = "unknown_discriminator";
inline constexpr const char* Missing = "missing";
inline constexpr const char* BoolType = "bool_type";
inline constexpr const char* IntType = "int_type";
inline constexpr const char* IntFromFloat = "int_from_float";
inline constexpr const char* GreaterThanEqual = "greater_than_equal";
inline constexpr const char* LessThanEqual = "less_than_equal";
inline constexpr const char* FloatType = "float_type";
inline constexpr const char* StringType = "string_type";
inline constexpr const char* ListType = "list_type";
inline constexpr const char* Enum = "enum";
inline constexpr const char* NoneRequired = "none_required";
inline constexpr const char* HandlerError = "handler_error";
inline constexpr const char* RoutingError = "routing_error";
} // namespace IssueType

void to_json(nlohmann::json& j, const ValidationIssue& issue);

std::string describeIssues(const std::vector<ValidationIssue>& issues);

} // namespace Switchboard
