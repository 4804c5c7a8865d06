/**
 * @file Sections.cpp
 * @brief Implementation of section coalescing
 */

#include "confres/Sections.hpp"
#include "confres/Errors.hpp"
#include "confres/Merge.hpp"
#include "confres/SectionName.hpp"

namespace confres {

namespace {

void require_object(const std::string& key, const Value& v) {
    if (!v.is_object()) {
        throw ConfigError(ErrorKind::Structure,
                          "error: config section [" + key + "] must contain settings, not " +
                          type_name(v));
    }
}

} // anonymous namespace

CoalescedDocument coalesce_sections(const std::regex& key_re, const RawEntries& entries) {
    CoalescedDocument result;

    for (const auto& [key, value] : entries) {
        if (!std::regex_match(key, key_re)) {
            result.passthrough[key] = value;
            continue;
        }

        const SectionName parsed = parse_section_name("[" + key + "]");
        require_object(key, value);
        Section& section = result.sections[parsed.section];

        if (parsed.subsection) {
            if (section.subsections.count(*parsed.subsection) > 0) {
                throw DuplicateSectionError(key, true);
            }
            section.subsections.emplace(*parsed.subsection, value);
            continue;
        }

        if (parsed.section != key) {
            throw InvariantError("error: parsed config section [\"" + escape_subsection(key) +
                                 "\"] incorrectly (\"" + escape_subsection(parsed.section) +
                                 "\" != \"" + escape_subsection(key) + "\"); please report");
        }
        if (section.has_sectionwide) {
            throw DuplicateSectionError(key, false);
        }
        section.settings = merge_settings(section.settings, value);
        section.has_sectionwide = true;
    }

    return result;
}

CoalescedDocument coalesce_sections(const std::regex& key_re, const Value& document) {
    return coalesce_sections(key_re, to_entries(document));
}

Section to_section(const SectionResult<Value>& result) {
    Section section;
    section.settings = result.sectionwide;
    section.has_sectionwide = true;
    section.subsections = result.subsections;
    return section;
}

Value flatten_section(const SectionResult<Value>& result) {
    if (!result.has_subsections()) {
        return result.sectionwide;
    }
    Value out = Value::object();
    for (const auto& [name, settings] : result.subsections) {
        out[name] = settings;
    }
    return out;
}

} // namespace confres
