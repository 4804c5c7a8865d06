/**
 * @file SectionName.hpp
 * @brief git-config style section header parsing
 *
 * Accepts the subset of git-config(1) section syntax used by configuration
 * documents:
 *
 *     [section]
 *     [section "subsection"]
 *
 * The section name is made of letters, digits and hyphens. The subsection
 * is separated by spaces or tabs and must be double-quoted; inside it a
 * backslash escapes the following character (`\"` is a quote, `\\` a
 * backslash, `\x` is just `x`).
 */

#ifndef CONFRES_SECTIONNAME_HPP
#define CONFRES_SECTIONNAME_HPP

#include <optional>
#include <string>

namespace confres {

/**
 * @brief A parsed section header
 */
struct SectionName {
    std::string section;
    std::optional<std::string> subsection;

    bool operator==(const SectionName& other) const {
        return section == other.section && subsection == other.subsection;
    }
    bool operator!=(const SectionName& other) const { return !(*this == other); }
};

/**
 * @brief Parse a bracketed section header.
 *
 * @param header Header text including the brackets, e.g. `[database "main"]`
 * @return The section and, when present, the unescaped subsection
 * @throws SectionNameError if the header does not match the grammar, if the
 *         subsection does not start with a double quote, or if it does not
 *         end with an unescaped double quote
 *
 * Examples:
 * ```cpp
 * parse_section_name("[database]");             // {"database", nullopt}
 * parse_section_name("[database \"primary\"]"); // {"database", "primary"}
 * parse_section_name("[db \"a\\\"b\"]");        // {"db", "a\"b"}
 * parse_section_name("[db primary]");           // throws
 * ```
 */
SectionName parse_section_name(const std::string& header);

/**
 * @brief Escape a subsection name for use inside double quotes
 *
 * Backslashes and double quotes are prefixed with a backslash.
 */
std::string escape_subsection(const std::string& subsection);

/**
 * @brief Build the bracketed header for a section name.
 *
 * parse_section_name(format_section_header(n)) == n for every valid n.
 */
std::string format_section_header(const SectionName& name);

/**
 * @brief Build the unbracketed document key for a section name
 *
 * This is the form used as a top-level key of a raw document,
 * e.g. `database "primary"`.
 */
std::string format_section_key(const SectionName& name);

/**
 * @brief Check whether a character may appear in a section name
 */
bool is_section_name_char(char c) noexcept;

} // namespace confres

#endif // CONFRES_SECTIONNAME_HPP
