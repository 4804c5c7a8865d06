/**
 * @file Value.hpp
 * @brief Raw value type for configuration documents
 *
 * Uses nlohmann::json as the underlying value model. A raw configuration
 * document is a Value object whose members are sections, each an object of
 * key -> raw value (string, integer, boolean or array of strings).
 */

#ifndef CONFRES_VALUE_HPP
#define CONFRES_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace confres {

/**
 * @brief JSON-like value type for raw configuration data
 */
using Value = nlohmann::json;

/**
 * @brief Ordered top-level entries of a raw document
 *
 * Unlike a Value object, an entry list may name the same header twice,
 * which is how a document reader reports a repeated section.
 */
using RawEntries = std::vector<std::pair<std::string, Value>>;

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

/**
 * @brief Render a raw scalar the way it appears in a config file
 *
 * Strings are returned without quotes; other values use their JSON text.
 */
inline std::string raw_text(const Value& val) {
    if (val.is_string()) return val.get<std::string>();
    return val.dump();
}

/**
 * @brief Split a Value object into ordered entries
 */
inline RawEntries to_entries(const Value& document) {
    RawEntries entries;
    if (!document.is_object()) return entries;
    for (auto it = document.begin(); it != document.end(); ++it) {
        entries.emplace_back(it.key(), it.value());
    }
    return entries;
}

/**
 * @brief Collect entries into a Value object
 *
 * When a key repeats, the last entry wins.
 */
inline Value to_document(const RawEntries& entries) {
    Value document = Value::object();
    for (const auto& [key, value] : entries) {
        document[key] = value;
    }
    return document;
}

} // namespace confres

#endif // CONFRES_VALUE_HPP
