/**
 * @file Loader.hpp
 * @brief Reading raw configuration documents from files
 *
 * Implements loading a raw document from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * Both formats must produce a top-level object of sections. Subsections are
 * written as quoted top-level keys:
 *
 *     # TOML
 *     [database]
 *     subname = "//localhost:5432/pdb"
 *
 *     ['database "archive"']
 *     subname = "//localhost:5432/pdb-archive"
 */

#ifndef CONFRES_LOADER_HPP
#define CONFRES_LOADER_HPP

#include "confres/Value.hpp"
#include <string>

namespace confres {

// ============================================================================
// JSON File Loading
// ============================================================================

/**
 * @brief Load a raw document from a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value object
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if JSON syntax is invalid or the root is not an object
 */
Value load_json_file(const std::string& path);

// ============================================================================
// TOML File Loading
// ============================================================================

/**
 * @brief Load a raw document from a TOML file.
 *
 * Dates and times are kept as their TOML text.
 *
 * @param path Path to the TOML file
 * @return Parsed Value object
 * @throws FileNotFoundError if file doesn't exist
 * @throws ConfigParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Parse a raw document from TOML text.
 *
 * @param text TOML source
 * @param source_name Name used in error messages
 * @throws ConfigParseError if TOML syntax is invalid
 */
Value parse_toml(const std::string& text, const std::string& source_name = "<string>");

// ============================================================================
// Auto-detect File Loading
// ============================================================================

/**
 * @brief Load a raw document, detecting the format by extension.
 *
 * @param path Path to config file (.json or .toml)
 * @return Parsed Value object
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the file has syntax errors
 * @throws ConfigError (io) if extension is not .json or .toml
 */
Value load_config_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace confres

#endif // CONFRES_LOADER_HPP
