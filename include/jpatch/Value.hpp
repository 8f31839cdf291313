/**
 * @file Value.hpp
 * @brief Value type for structured reads and generic replacement values
 *
 * Uses nlohmann::json as the underlying value model. Text-level patching
 * never round-trips a document through this type; it is only used for
 * rendering replacement values and for the comment-tolerant read path.
 */

#ifndef JPATCH_VALUE_HPP
#define JPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace jpatch {

/**
 * @brief JSON value type
 *
 * Alias for nlohmann::json. See nlohmann::json documentation for the
 * complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace jpatch

#endif // JPATCH_VALUE_HPP
