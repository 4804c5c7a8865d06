/**
 * @file Errors.hpp
 * @brief Exception types for configuration resolution errors
 *
 * Every failure raised while resolving a configuration document is a
 * ConfigError carrying a human-readable message and an ErrorKind tag:
 * - SectionNameError: Malformed section header (grammar)
 * - DuplicateSectionError: Same section or subsection supplied twice (structure)
 * - SchemaError: Missing or ill-typed keys (schema)
 * - ConversionError: Value cannot be coerced to its declared type (conversion)
 * - InvariantError: Domain or internal invariant violated (invariant)
 * - FileNotFoundError / ConfigParseError: Loading a document from disk (io)
 */

#ifndef CONFRES_ERRORS_HPP
#define CONFRES_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace confres {

/**
 * @brief Machine-checkable category of a configuration error
 */
enum class ErrorKind {
    Grammar,
    Structure,
    Schema,
    Conversion,
    Invariant,
    Io
};

/**
 * @brief Name of an error kind, as used in diagnostics
 */
inline const char* kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Grammar: return "grammar";
        case ErrorKind::Structure: return "structure";
        case ErrorKind::Schema: return "schema";
        case ErrorKind::Conversion: return "conversion";
        case ErrorKind::Invariant: return "invariant";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

/**
 * @brief Base class for all confres exceptions
 */
class ConfigError : public std::runtime_error {
public:
    ConfigError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    /**
     * @brief Get the error category
     */
    ErrorKind kind() const noexcept {
        return kind_;
    }

private:
    ErrorKind kind_;
};

/**
 * @brief Section header does not follow the git-config section syntax
 */
class SectionNameError : public ConfigError {
public:
    /**
     * @brief Construct with the offending header and a message
     * @param header The header text, including brackets
     * @param message Full diagnostic message
     */
    SectionNameError(std::string header, const std::string& message)
        : ConfigError(ErrorKind::Grammar, message)
        , header_(std::move(header))
    {}

    const std::string& header() const noexcept {
        return header_;
    }

private:
    std::string header_;
};

/**
 * @brief A section or subsection was supplied more than once
 */
class DuplicateSectionError : public ConfigError {
public:
    /**
     * @brief Construct with the top-level key that repeated a section
     * @param key The raw document key (e.g. `database "primary"`)
     * @param subsection true when the repeated entry names a subsection
     */
    DuplicateSectionError(std::string key, bool subsection)
        : ConfigError(ErrorKind::Structure, format_message(key, subsection))
        , key_(std::move(key))
        , subsection_(subsection)
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    bool is_subsection() const noexcept {
        return subsection_;
    }

private:
    std::string key_;
    bool subsection_;

    static std::string format_message(const std::string& key, bool subsection) {
        std::ostringstream oss;
        oss << "error: multiple [\"";
        for (char c : key) {
            if (c == '"' || c == '\\') oss << '\\';
            oss << c;
        }
        oss << "\"] " << (subsection ? "subsections" : "sections") << " in config file";
        return oss.str();
    }
};

/**
 * @brief Settings do not satisfy a section's type specification
 *
 * Contains every key that failed validation.
 */
class SchemaError : public ConfigError {
public:
    /**
     * @brief Construct with the section label and offending keys
     * @param section Section (or subsection) label for the message
     * @param keys Keys that are missing, unexpected or ill-typed
     * @param problem Short description of what is wrong with them
     */
    SchemaError(const std::string& section, std::vector<std::string> keys,
                const std::string& problem)
        : ConfigError(ErrorKind::Schema, format_message(section, keys, problem))
        , keys_(std::move(keys))
    {}

    /**
     * @brief Get the offending keys
     */
    const std::vector<std::string>& keys() const noexcept {
        return keys_;
    }

private:
    std::vector<std::string> keys_;

    static std::string format_message(const std::string& section,
                                      const std::vector<std::string>& keys,
                                      const std::string& problem) {
        std::ostringstream oss;
        oss << "Invalid [" << section << "] configuration: " << problem << ": [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief A raw value cannot be converted to its declared semantic type
 */
class ConversionError : public ConfigError {
public:
    /**
     * @brief Construct with key, raw value and reason
     * @param key Configuration key being converted
     * @param raw Raw value as text
     * @param reason What the value should have been
     */
    ConversionError(std::string key, std::string raw, const std::string& reason)
        : ConfigError(ErrorKind::Conversion,
                      "Cannot convert value '" + raw + "' of configuration item `" +
                      key + "`: " + reason)
        , key_(std::move(key))
        , raw_(std::move(raw))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& raw() const noexcept {
        return raw_;
    }

private:
    std::string key_;
    std::string raw_;
};

/**
 * @brief Cross-field rule or internal precondition violated
 */
class InvariantError : public ConfigError {
public:
    explicit InvariantError(const std::string& message)
        : ConfigError(ErrorKind::Invariant, message)
    {}
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError(ErrorKind::Io, "Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line 1-based line, 0 when unknown
     * @param column 1-based column, 0 when unknown
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : ConfigError(ErrorKind::Io, format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) oss << " at line " << line << ", column " << column;
        oss << ": " << details;
        return oss.str();
    }
};

} // namespace confres

#endif // CONFRES_ERRORS_HPP
