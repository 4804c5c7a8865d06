/**
 * @file Schema.hpp
 * @brief Declarative section specifications and the defaulting/conversion pipeline
 *
 * Each section is described twice:
 * - an IncomingSpec: the raw shape users may write, with defaults
 * - an OutgoingSpec: the resolved shape, with semantic types and constraints
 *
 * convert_section() takes raw settings through the whole pipeline:
 *
 *     warn unknown keys -> strip them -> validate incoming -> apply defaults
 *       -> convert to semantic types -> validate outgoing
 *
 * and yields a ResolvedSection that satisfies the outgoing spec exactly.
 */

#ifndef CONFRES_SCHEMA_HPP
#define CONFRES_SCHEMA_HPP

#include "confres/Duration.hpp"
#include "confres/Value.hpp"

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace confres {

// ============================================================================
// Resolved values
// ============================================================================

using StringList = std::vector<std::string>;

/**
 * @brief A converted setting value
 */
using FieldValue = std::variant<std::int64_t, bool, std::string, Minutes, Days, Period, StringList>;

/**
 * @brief Semantic type of a resolved setting
 *
 * Enumerators are in the same order as the FieldValue alternatives.
 */
enum class SemanticType {
    Integer,
    Boolean,
    String,
    Minutes,
    Days,
    Period,
    StringList
};

const char* semantic_type_name(SemanticType type) noexcept;

/**
 * @brief Semantic type held by a FieldValue
 */
inline SemanticType type_of(const FieldValue& value) noexcept {
    return static_cast<SemanticType>(value.index());
}

/**
 * @brief Key -> typed value map for one resolved section or subsection
 */
class ResolvedSection {
public:
    ResolvedSection() = default;
    explicit ResolvedSection(std::map<std::string, FieldValue> values)
        : values_(std::move(values)) {}

    bool contains(const std::string& key) const { return values_.count(key) > 0; }
    bool empty() const noexcept { return values_.empty(); }
    size_t size() const noexcept { return values_.size(); }

    /**
     * @brief Find a value
     * @return Pointer to the value, or nullptr if the key is absent
     */
    const FieldValue* find(const std::string& key) const {
        auto it = values_.find(key);
        return it == values_.end() ? nullptr : &it->second;
    }

    /**
     * @brief Get a value of a known type
     * @throws std::out_of_range if the key is absent
     * @throws std::bad_variant_access if the value has another type
     */
    template <typename T>
    const T& get(const std::string& key) const {
        return std::get<T>(values_.at(key));
    }

    /**
     * @brief Get a value if present and of type T
     */
    template <typename T>
    std::optional<T> get_optional(const std::string& key) const {
        const FieldValue* v = find(key);
        if (!v) return std::nullopt;
        if (const T* typed = std::get_if<T>(v)) return *typed;
        return std::nullopt;
    }

    void set(const std::string& key, FieldValue value) { values_[key] = std::move(value); }
    void erase(const std::string& key) { values_.erase(key); }

    const std::map<std::string, FieldValue>& values() const noexcept { return values_; }

    bool operator==(const ResolvedSection& o) const { return values_ == o.values_; }
    bool operator!=(const ResolvedSection& o) const { return !(*this == o); }

private:
    std::map<std::string, FieldValue> values_;
};

// ============================================================================
// Incoming specification
// ============================================================================

/**
 * @brief Coarse raw type accepted for an incoming key
 */
enum class RawType {
    Integer, ///< integer or integer-like string
    String,  ///< string (booleans and integers accepted as their text)
    Enum,    ///< one of a fixed set of strings
    List     ///< delimited string or array of strings
};

/**
 * @brief Computes a default raw value when the key is absent
 */
using DefaultProvider = std::function<Value()>;

/**
 * @brief Incoming description of one key
 */
struct IncomingField {
    RawType type = RawType::String;
    bool required = false;
    std::optional<Value> default_value;
    DefaultProvider default_provider;
    std::vector<std::string> choices;

    bool has_default() const { return default_value.has_value() || static_cast<bool>(default_provider); }
    Value make_default() const { return default_provider ? default_provider() : *default_value; }
};

/**
 * @brief Accepted raw shape of a section
 */
class IncomingSpec {
public:
    IncomingSpec() = default;
    IncomingSpec(std::initializer_list<std::pair<const std::string, IncomingField>> fields)
        : fields_(fields) {}

    const IncomingField* find(const std::string& key) const {
        auto it = fields_.find(key);
        return it == fields_.end() ? nullptr : &it->second;
    }
    bool contains(const std::string& key) const { return fields_.count(key) > 0; }
    const std::map<std::string, IncomingField>& fields() const noexcept { return fields_; }

    /**
     * @brief Copy of this spec with @p extra's fields added (extra wins)
     */
    IncomingSpec merged(const IncomingSpec& extra) const;

private:
    std::map<std::string, IncomingField> fields_;
};

namespace in {

IncomingField optional_int();
IncomingField defaulted_int(std::int64_t def);
IncomingField defaulted_int(DefaultProvider provider);
IncomingField required_int();
IncomingField optional_string();
IncomingField defaulted_string(const std::string& def);
IncomingField required_string();
IncomingField defaulted_enum(std::vector<std::string> choices, const std::string& def);
IncomingField optional_list();

} // namespace in

// ============================================================================
// Outgoing specification
// ============================================================================

/**
 * @brief Resolved description of one key
 */
struct OutgoingField {
    SemanticType type = SemanticType::String;
    bool optional = false;
    std::function<bool(const FieldValue&)> constraint;
    std::string constraint_description;
};

/**
 * @brief Resolved shape of a section
 */
class OutgoingSpec {
public:
    OutgoingSpec() = default;
    OutgoingSpec(std::initializer_list<std::pair<const std::string, OutgoingField>> fields)
        : fields_(fields) {}

    const OutgoingField* find(const std::string& key) const {
        auto it = fields_.find(key);
        return it == fields_.end() ? nullptr : &it->second;
    }
    bool contains(const std::string& key) const { return fields_.count(key) > 0; }
    const std::map<std::string, OutgoingField>& fields() const noexcept { return fields_; }

    OutgoingSpec merged(const OutgoingSpec& extra) const;

private:
    std::map<std::string, OutgoingField> fields_;
};

namespace out {

OutgoingField required(SemanticType type);
OutgoingField optional(SemanticType type);
OutgoingField non_negative_int();

} // namespace out

// ============================================================================
// Pipeline
// ============================================================================

/**
 * @brief Keys of @p settings that @p spec does not declare
 */
std::vector<std::string> unknown_keys(const IncomingSpec& spec, const Value& settings);

/**
 * @brief Log a warning for every unknown key in @p settings
 */
void warn_unknown_keys(const IncomingSpec& spec, const Value& settings);

/**
 * @brief Copy of @p settings without unknown keys and without null values
 */
Value strip_unknown_keys(const IncomingSpec& spec, const Value& settings);

/**
 * @brief Validate settings against an incoming spec
 *
 * @param section Label used in error messages (e.g. `database "primary"`)
 * @throws SchemaError naming missing required keys or ill-typed keys
 */
void validate_incoming(const IncomingSpec& spec, const Value& settings, const std::string& section);

/**
 * @brief Warn about unknown keys, strip them and validate the rest
 */
Value warn_and_validate(const IncomingSpec& spec, const Value& settings, const std::string& section);

/**
 * @brief Fill every absent optional key that has a default
 */
Value apply_defaults(const IncomingSpec& spec, const Value& settings);

/**
 * @brief Convert one raw value to a semantic type
 *
 * @throws ConversionError naming @p key and the raw value
 */
FieldValue convert_value(const std::string& key, const Value& raw, SemanticType type);

/**
 * @brief Convert every key of @p settings to its outgoing type
 *
 * @throws SchemaError if a key is not declared by @p spec
 * @throws ConversionError if a value cannot be converted or violates a
 *         declared constraint
 */
ResolvedSection convert_to_spec(const OutgoingSpec& spec, const Value& settings, const std::string& section);

/**
 * @brief Check a resolved section against an outgoing spec exactly
 *
 * @throws SchemaError on unknown keys, missing required keys or values of
 *         the wrong semantic type
 * @throws ConversionError on a constraint violation
 */
void validate_outgoing(const OutgoingSpec& spec, const ResolvedSection& resolved, const std::string& section);

/**
 * @brief Copy of @p resolved without keys that @p spec does not declare
 */
ResolvedSection strip_unknown_keys(const OutgoingSpec& spec, const ResolvedSection& resolved);

/**
 * @brief Run the whole defaulting/conversion pipeline on one section.
 *
 * @param incoming Accepted raw shape, with defaults
 * @param outgoing Resolved shape
 * @param settings Raw settings (an object, or null for an absent section)
 * @param section Label used in diagnostics
 * @return Settings converted to their semantic types
 */
ResolvedSection convert_section(const IncomingSpec& incoming, const OutgoingSpec& outgoing,
                                const Value& settings, const std::string& section);

// ============================================================================
// Rendering
// ============================================================================

/**
 * @brief Raw form of a value, accepted back by convert_value()
 */
Value to_raw(const FieldValue& value);

/**
 * @brief Raw form of a section; convert_section() maps it back to @p resolved
 */
Value to_raw(const ResolvedSection& resolved);

/**
 * @brief Text of a raw form, for messages
 */
std::string field_text(const FieldValue& value);

/**
 * @brief JSON rendering for display (durations in ISO-8601)
 */
Value render_json(const FieldValue& value);
Value render_json(const ResolvedSection& resolved);

} // namespace confres

#endif // CONFRES_SCHEMA_HPP
