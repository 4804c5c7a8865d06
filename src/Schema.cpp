/**
 * @file Schema.cpp
 * @brief Implementation of the defaulting/conversion pipeline
 */

#include "confres/Schema.hpp"
#include "confres/Errors.hpp"
#include "confres/Log.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace confres {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

/**
 * @brief Whether a raw value is written as an integer (sign and digits)
 */
bool is_integer_like(const Value& raw) {
    if (raw.is_number_integer()) return true;
    if (!raw.is_string()) return false;

    const std::string text = trim(raw.get<std::string>());
    if (text.empty()) return false;
    size_t i = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (i == text.size()) return false;
    for (size_t j = i; j < text.size(); ++j) {
        if (!std::isdigit(static_cast<unsigned char>(text[j]))) return false;
    }
    return true;
}

/**
 * @brief Parse an integer-like raw value
 * @return nullopt if it is not integer-like or does not fit in int64
 */
std::optional<std::int64_t> as_integer(const Value& raw) {
    if (!is_integer_like(raw)) return std::nullopt;
    if (raw.is_number_unsigned()) {
        const auto n = raw.get<std::uint64_t>();
        if (n > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(n);
    }
    if (raw.is_number_integer()) return raw.get<std::int64_t>();

    const std::string text = trim(raw.get<std::string>());
    try {
        size_t pos = 0;
        long long val = std::stoll(text, &pos);
        if (pos != text.size()) return std::nullopt;
        return static_cast<std::int64_t>(val);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/**
 * @brief Text of a scalar raw value accepted by a string key
 */
std::optional<std::string> as_string(const Value& raw) {
    if (raw.is_string()) return raw.get<std::string>();
    if (raw.is_boolean()) return std::string(raw.get<bool>() ? "true" : "false");
    if (raw.is_number_integer()) return raw.dump();
    return std::nullopt;
}

std::optional<StringList> as_list(const Value& raw) {
    StringList items;
    if (raw.is_array()) {
        for (const auto& elem : raw) {
            if (!elem.is_string()) return std::nullopt;
            std::string item = trim(elem.get<std::string>());
            if (!item.empty()) items.push_back(std::move(item));
        }
        return items;
    }
    if (!raw.is_string()) return std::nullopt;

    std::string current;
    for (char c : raw.get<std::string>()) {
        if (c == ',' || c == ';') {
            std::string item = trim(current);
            if (!item.empty()) items.push_back(std::move(item));
            current.clear();
        } else {
            current += c;
        }
    }
    std::string item = trim(current);
    if (!item.empty()) items.push_back(std::move(item));
    return items;
}

bool accepts(const IncomingField& field, const Value& raw) {
    switch (field.type) {
        case RawType::Integer:
            // range is checked on conversion so the error names the value
            return is_integer_like(raw);
        case RawType::String:
            return as_string(raw).has_value();
        case RawType::Enum: {
            if (!raw.is_string()) return false;
            const auto& s = raw.get_ref<const std::string&>();
            return std::find(field.choices.begin(), field.choices.end(), s) != field.choices.end();
        }
        case RawType::List:
            return as_list(raw).has_value();
    }
    return false;
}

std::string join(const StringList& items, const std::string& sep) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << sep;
        oss << items[i];
    }
    return oss.str();
}

} // anonymous namespace

const char* semantic_type_name(SemanticType type) noexcept {
    switch (type) {
        case SemanticType::Integer: return "integer";
        case SemanticType::Boolean: return "boolean";
        case SemanticType::String: return "string";
        case SemanticType::Minutes: return "minutes";
        case SemanticType::Days: return "days";
        case SemanticType::Period: return "period";
        case SemanticType::StringList: return "list of strings";
    }
    return "unknown";
}

// ============================================================================
// Specifications
// ============================================================================

IncomingSpec IncomingSpec::merged(const IncomingSpec& extra) const {
    IncomingSpec result = *this;
    for (const auto& [key, field] : extra.fields_) {
        result.fields_[key] = field;
    }
    return result;
}

OutgoingSpec OutgoingSpec::merged(const OutgoingSpec& extra) const {
    OutgoingSpec result = *this;
    for (const auto& [key, field] : extra.fields_) {
        result.fields_[key] = field;
    }
    return result;
}

namespace in {

IncomingField optional_int() {
    IncomingField f;
    f.type = RawType::Integer;
    return f;
}

IncomingField defaulted_int(std::int64_t def) {
    IncomingField f = optional_int();
    f.default_value = Value(def);
    return f;
}

IncomingField defaulted_int(DefaultProvider provider) {
    IncomingField f = optional_int();
    f.default_provider = std::move(provider);
    return f;
}

IncomingField required_int() {
    IncomingField f = optional_int();
    f.required = true;
    return f;
}

IncomingField optional_string() {
    return IncomingField{};
}

IncomingField defaulted_string(const std::string& def) {
    IncomingField f;
    f.default_value = Value(def);
    return f;
}

IncomingField required_string() {
    IncomingField f;
    f.required = true;
    return f;
}

IncomingField defaulted_enum(std::vector<std::string> choices, const std::string& def) {
    IncomingField f;
    f.type = RawType::Enum;
    f.choices = std::move(choices);
    f.default_value = Value(def);
    return f;
}

IncomingField optional_list() {
    IncomingField f;
    f.type = RawType::List;
    return f;
}

} // namespace in

namespace out {

OutgoingField required(SemanticType type) {
    OutgoingField f;
    f.type = type;
    return f;
}

OutgoingField optional(SemanticType type) {
    OutgoingField f;
    f.type = type;
    f.optional = true;
    return f;
}

OutgoingField non_negative_int() {
    OutgoingField f = required(SemanticType::Integer);
    f.constraint = [](const FieldValue& v) {
        const auto* n = std::get_if<std::int64_t>(&v);
        return n && *n >= 0;
    };
    f.constraint_description = "must not be negative";
    return f;
}

} // namespace out

// ============================================================================
// Incoming side
// ============================================================================

std::vector<std::string> unknown_keys(const IncomingSpec& spec, const Value& settings) {
    std::vector<std::string> unknown;
    if (!settings.is_object()) return unknown;
    for (auto it = settings.begin(); it != settings.end(); ++it) {
        if (!spec.contains(it.key())) unknown.push_back(it.key());
    }
    return unknown;
}

void warn_unknown_keys(const IncomingSpec& spec, const Value& settings) {
    for (const auto& key : unknown_keys(spec, settings)) {
        logger()->warn("The configuration item `{}` does not exist and should be removed from the config.",
                       key);
    }
}

Value strip_unknown_keys(const IncomingSpec& spec, const Value& settings) {
    Value result = Value::object();
    if (!settings.is_object()) return result;
    for (auto it = settings.begin(); it != settings.end(); ++it) {
        if (spec.contains(it.key()) && !it.value().is_null()) {
            result[it.key()] = it.value();
        }
    }
    return result;
}

void validate_incoming(const IncomingSpec& spec, const Value& settings, const std::string& section) {
    std::vector<std::string> missing;
    std::vector<std::string> ill_typed;
    std::vector<std::string> unexpected;

    for (const auto& [key, field] : spec.fields()) {
        if (field.required && !settings.contains(key)) missing.push_back(key);
    }
    for (auto it = settings.begin(); it != settings.end(); ++it) {
        const IncomingField* field = spec.find(it.key());
        if (!field) {
            unexpected.push_back(it.key());
        } else if (!accepts(*field, it.value())) {
            ill_typed.push_back(it.key());
        }
    }

    if (!missing.empty()) throw SchemaError(section, missing, "missing required keys");
    if (!unexpected.empty()) throw SchemaError(section, unexpected, "unexpected keys");
    if (!ill_typed.empty()) throw SchemaError(section, ill_typed, "values of the wrong type");
}

Value warn_and_validate(const IncomingSpec& spec, const Value& settings, const std::string& section) {
    if (!settings.is_null() && !settings.is_object()) {
        throw ConfigError(ErrorKind::Structure,
                          "error: config section [" + section + "] must contain settings, not " +
                          type_name(settings));
    }
    warn_unknown_keys(spec, settings);
    Value stripped = strip_unknown_keys(spec, settings);
    validate_incoming(spec, stripped, section);
    return stripped;
}

Value apply_defaults(const IncomingSpec& spec, const Value& settings) {
    Value result = settings.is_object() ? settings : Value::object();
    for (const auto& [key, field] : spec.fields()) {
        if (!result.contains(key) && field.has_default()) {
            result[key] = field.make_default();
        }
    }
    return result;
}

// ============================================================================
// Conversion
// ============================================================================

FieldValue convert_value(const std::string& key, const Value& raw, SemanticType type) {
    switch (type) {
        case SemanticType::Integer: {
            if (auto n = as_integer(raw)) return *n;
            throw ConversionError(key, raw_text(raw),
                                  "expected an integer in the 64-bit signed range");
        }
        case SemanticType::Boolean: {
            if (raw.is_boolean()) return raw.get<bool>();
            if (raw.is_string()) {
                const std::string text = to_lower(trim(raw.get<std::string>()));
                if (text == "true") return true;
                if (text == "false") return false;
            }
            throw ConversionError(key, raw_text(raw), "expected true or false");
        }
        case SemanticType::String: {
            if (auto s = as_string(raw)) return *s;
            throw ConversionError(key, raw_text(raw), "expected a string");
        }
        case SemanticType::Minutes: {
            if (auto n = as_integer(raw)) return Minutes(*n);
            throw ConversionError(key, raw_text(raw), "expected a whole number of minutes");
        }
        case SemanticType::Days: {
            if (auto n = as_integer(raw)) return Days(*n);
            throw ConversionError(key, raw_text(raw), "expected a whole number of days");
        }
        case SemanticType::Period: {
            if (raw.is_string()) {
                if (auto p = parse_period(raw.get<std::string>())) return *p;
            }
            throw ConversionError(key, raw_text(raw),
                                  "expected a period such as 14d, 12h, 30m, 10s or 500ms");
        }
        case SemanticType::StringList: {
            if (auto items = as_list(raw)) return *items;
            throw ConversionError(key, raw_text(raw), "expected a comma-separated list");
        }
    }
    throw InvariantError("unhandled semantic type for `" + key + "`");
}

ResolvedSection convert_to_spec(const OutgoingSpec& spec, const Value& settings, const std::string& section) {
    std::vector<std::string> undeclared;
    ResolvedSection resolved;

    for (auto it = settings.begin(); it != settings.end(); ++it) {
        const OutgoingField* field = spec.find(it.key());
        if (!field) {
            undeclared.push_back(it.key());
            continue;
        }
        FieldValue converted = convert_value(it.key(), it.value(), field->type);
        if (field->constraint && !field->constraint(converted)) {
            throw ConversionError(it.key(), raw_text(it.value()), field->constraint_description);
        }
        resolved.set(it.key(), std::move(converted));
    }

    if (!undeclared.empty()) throw SchemaError(section, undeclared, "unexpected keys");
    return resolved;
}

void validate_outgoing(const OutgoingSpec& spec, const ResolvedSection& resolved, const std::string& section) {
    std::vector<std::string> missing;
    std::vector<std::string> unexpected;
    std::vector<std::string> ill_typed;

    for (const auto& [key, field] : spec.fields()) {
        if (!field.optional && !resolved.contains(key)) missing.push_back(key);
    }
    for (const auto& [key, value] : resolved.values()) {
        const OutgoingField* field = spec.find(key);
        if (!field) {
            unexpected.push_back(key);
        } else if (type_of(value) != field->type) {
            ill_typed.push_back(key);
        } else if (field->constraint && !field->constraint(value)) {
            throw ConversionError(key, field_text(value), field->constraint_description);
        }
    }

    if (!missing.empty()) throw SchemaError(section, missing, "missing required keys");
    if (!unexpected.empty()) throw SchemaError(section, unexpected, "unexpected keys");
    if (!ill_typed.empty()) throw SchemaError(section, ill_typed, "values of the wrong type");
}

ResolvedSection strip_unknown_keys(const OutgoingSpec& spec, const ResolvedSection& resolved) {
    ResolvedSection result;
    for (const auto& [key, value] : resolved.values()) {
        if (spec.contains(key)) result.set(key, value);
    }
    return result;
}

ResolvedSection convert_section(const IncomingSpec& incoming, const OutgoingSpec& outgoing,
                                const Value& settings, const std::string& section) {
    Value validated = warn_and_validate(incoming, settings, section);
    Value defaulted = apply_defaults(incoming, validated);
    ResolvedSection resolved = convert_to_spec(outgoing, defaulted, section);
    validate_outgoing(outgoing, resolved, section);
    return resolved;
}

// ============================================================================
// Rendering
// ============================================================================

Value to_raw(const FieldValue& value) {
    switch (type_of(value)) {
        case SemanticType::Integer: return Value(std::get<std::int64_t>(value));
        case SemanticType::Boolean: return Value(std::get<bool>(value) ? "true" : "false");
        case SemanticType::String: return Value(std::get<std::string>(value));
        case SemanticType::Minutes: return Value(static_cast<std::int64_t>(std::get<Minutes>(value).count()));
        case SemanticType::Days: return Value(static_cast<std::int64_t>(std::get<Days>(value).count()));
        case SemanticType::Period: return Value(format_period(std::get<Period>(value)));
        case SemanticType::StringList: return Value(std::get<StringList>(value));
    }
    return Value();
}

Value to_raw(const ResolvedSection& resolved) {
    Value out = Value::object();
    for (const auto& [key, value] : resolved.values()) {
        out[key] = to_raw(value);
    }
    return out;
}

std::string field_text(const FieldValue& value) {
    if (const auto* items = std::get_if<StringList>(&value)) return join(*items, ",");
    return raw_text(to_raw(value));
}

Value render_json(const FieldValue& value) {
    switch (type_of(value)) {
        case SemanticType::Boolean: return Value(std::get<bool>(value));
        case SemanticType::Minutes:
            return Value("PT" + std::to_string(std::get<Minutes>(value).count()) + "M");
        case SemanticType::Days:
            return Value("P" + std::to_string(std::get<Days>(value).count()) + "D");
        case SemanticType::Period: return Value(iso8601(std::get<Period>(value)));
        default: return to_raw(value);
    }
}

Value render_json(const ResolvedSection& resolved) {
    Value out = Value::object();
    for (const auto& [key, value] : resolved.values()) {
        out[key] = render_json(value);
    }
    return out;
}

} // namespace confres
