/**
 * @file SectionName.cpp
 * @brief Implementation of section header parsing
 */

#include "confres/SectionName.hpp"
#include "confres/Errors.hpp"

#include <cctype>

namespace confres {

namespace {

/**
 * @brief Quote a header for diagnostics, escaping quotes and backslashes
 */
std::string quoted(const std::string& s) {
    return "\"" + escape_subsection(s) + "\"";
}

[[noreturn]] void fail(const std::string& header, const std::string& problem) {
    throw SectionNameError(header, "error: " + problem);
}

bool is_blank(char c) noexcept {
    return c == ' ' || c == '\t';
}

/**
 * @brief Characters allowed in subsection text: printable text and UTF-8
 */
bool is_subsection_char(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    if (u >= 0x80) return true;
    return std::isprint(u) || is_blank(c);
}

} // anonymous namespace

bool is_section_name_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
}

SectionName parse_section_name(const std::string& header) {
    if (header.size() < 3 || header.front() != '[' || header.back() != ']') {
        fail(header, "invalid section name " + quoted(header));
    }

    const std::string body = header.substr(1, header.size() - 2);

    size_t pos = 0;
    while (pos < body.size() && is_section_name_char(body[pos])) ++pos;
    if (pos == 0) {
        fail(header, "invalid section name " + quoted(header));
    }

    SectionName result;
    result.section = body.substr(0, pos);
    if (pos == body.size()) {
        return result;
    }

    if (!is_blank(body[pos])) {
        fail(header, "invalid section name " + quoted(header));
    }
    while (pos < body.size() && is_blank(body[pos])) ++pos;

    const std::string subtxt = body.substr(pos);
    if (subtxt.empty()) {
        fail(header, "invalid section name " + quoted(header));
    }
    for (char c : subtxt) {
        if (!is_subsection_char(c)) {
            fail(header, "invalid section name " + quoted(header));
        }
    }

    if (subtxt.front() != '"') {
        fail(header, "config subsection " + quoted(header) +
                     " must start with a double-quote");
    }
    if (subtxt.size() < 2 || subtxt.back() != '"') {
        fail(header, "config subsection " + quoted(header) +
                     " must end with an unescaped double-quote");
    }

    // An odd run of backslashes before the final quote escapes it.
    size_t backslashes = 0;
    for (size_t i = subtxt.size() - 1; i > 0 && subtxt[i - 1] == '\\'; --i) {
        ++backslashes;
    }
    if (backslashes % 2 == 1) {
        fail(header, "config subsection " + quoted(header) +
                     " must end with an unescaped double-quote");
    }

    const std::string inner = subtxt.substr(1, subtxt.size() - 2);
    std::string unescaped;
    unescaped.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.size()) {
            unescaped += inner[++i];
        } else {
            unescaped += inner[i];
        }
    }

    result.subsection = std::move(unescaped);
    return result;
}

std::string escape_subsection(const std::string& subsection) {
    std::string out;
    out.reserve(subsection.size() + 2);
    for (char c : subsection) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string format_section_key(const SectionName& name) {
    if (!name.subsection) return name.section;
    return name.section + " \"" + escape_subsection(*name.subsection) + "\"";
}

std::string format_section_header(const SectionName& name) {
    return "[" + format_section_key(name) + "]";
}

} // namespace confres
