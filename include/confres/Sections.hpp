/**
 * @file Sections.hpp
 * @brief Section coalescing and the subsection-settings fold
 *
 * A raw document names subsections through its top-level keys:
 *
 *     {"database": {"subname": "pdb"},
 *      "database \"replica\"": {"subname": "pdb-r"}}
 *
 * coalesce_sections() groups such keys into one Section per section name,
 * holding the sectionwide settings and each named subsection.
 * update_section_settings() then folds a function over a Section so that
 * every subsection sees the already-processed sectionwide result.
 */

#ifndef CONFRES_SECTIONS_HPP
#define CONFRES_SECTIONS_HPP

#include "confres/Value.hpp"

#include <map>
#include <optional>
#include <regex>
#include <string>

namespace confres {

/**
 * @brief One section of a coalesced document
 */
struct Section {
    /// Sectionwide settings (keys not tied to a subsection)
    Value settings = Value::object();

    /// Subsection name -> that subsection's own settings
    std::map<std::string, Value> subsections;

    /// Whether an entry supplied sectionwide settings
    bool has_sectionwide = false;

    bool has_subsections() const noexcept { return !subsections.empty(); }
};

/**
 * @brief Result of coalescing a raw document
 */
struct CoalescedDocument {
    /// Sections whose keys matched the coalescing pattern
    std::map<std::string, Section> sections;

    /// Every other top-level entry, unchanged
    Value passthrough = Value::object();

    /**
     * @brief Find a coalesced section
     * @return Pointer to the section, or nullptr if absent
     */
    const Section* find(const std::string& name) const {
        auto it = sections.find(name);
        return it == sections.end() ? nullptr : &it->second;
    }
};

/**
 * @brief Group section-header keys into a section tree.
 *
 * Keys that fully match @p key_re are parsed as section headers (without
 * the brackets); all other entries are passed through unchanged.
 *
 * @param key_re Pattern selecting the keys to coalesce, e.g. `database.*`
 * @param entries Top-level document entries, in document order
 * @return Coalesced sections plus pass-through entries
 * @throws SectionNameError if a matching key is not a valid header
 * @throws DuplicateSectionError if a section's sectionwide settings or a
 *         subsection are supplied twice
 * @throws ConfigError (structure) if a matching entry is not an object
 * @throws InvariantError if a plain key parses to a different section name
 */
CoalescedDocument coalesce_sections(const std::regex& key_re, const RawEntries& entries);

/**
 * @brief Coalesce the members of a Value object
 */
CoalescedDocument coalesce_sections(const std::regex& key_re, const Value& document);

/**
 * @brief Per-section results of update_section_settings()
 *
 * The sectionwide result is always computed and kept because subsections
 * inherit from it. The flat form (see flatten_section()) contains it only
 * when there are no subsections.
 */
template <typename Result>
struct SectionResult {
    Result sectionwide{};
    std::map<std::string, Result> subsections;

    bool has_subsections() const noexcept { return !subsections.empty(); }
};

/**
 * @brief Fold a transform over a section and its subsections.
 *
 * Calls `f(std::nullopt, Result{}, section.settings)` first; its result is
 * the sectionwide result. Then calls `f(name, sectionwide, settings)` for
 * every subsection, so each subsection starts from the processed (not raw)
 * sectionwide values.
 *
 * @tparam Result Type produced by the transform
 * @param section Section to fold over
 * @param f Callable `Result(const std::optional<std::string>&, const Result&, const Value&)`
 */
template <typename Result, typename Fn>
SectionResult<Result> update_section_settings(const Section& section, Fn&& f) {
    SectionResult<Result> out;
    const std::optional<std::string> none;
    out.sectionwide = f(none, Result{}, section.settings);
    for (const auto& [name, settings] : section.subsections) {
        out.subsections.emplace(name, f(std::optional<std::string>(name), out.sectionwide, settings));
    }
    return out;
}

/**
 * @brief Rebuild a Section from the raw results of a fold
 *
 * Used to feed the output of one fold (e.g. cascading) into the next.
 */
Section to_section(const SectionResult<Value>& result);

/**
 * @brief Flat output of a fold over raw values
 *
 * @return The sectionwide result when there are no subsections, otherwise
 *         an object keyed by subsection name
 */
Value flatten_section(const SectionResult<Value>& result);

} // namespace confres

#endif // CONFRES_SECTIONS_HPP
