/**
 * @file Database.hpp
 * @brief Resolution of the [database] and [read-database] sections
 *
 * A document may describe one database connection or several:
 *
 *     [database]                  sectionwide settings, the primary profile
 *     subname = //db/pdb
 *     user = pdb
 *
 *     [database "archive"]        a named profile; inherits the
 *     subname = //db/pdb-archive  sectionwide settings it does not override
 *
 * configure_db() takes every database profile through
 * Raw -> Cascaded -> Converted -> Fixed-up, validates the result and makes
 * sure a read profile exists, synthesizing one from the primary profile
 * when the document has no [read-database] section.
 */

#ifndef CONFRES_DATABASE_HPP
#define CONFRES_DATABASE_HPP

#include "confres/Schema.hpp"
#include "confres/Sections.hpp"
#include "confres/Value.hpp"

#include <map>
#include <optional>
#include <string>

namespace confres {

/// Default for report-ttl, and the bound for resource-events-ttl
extern const char* const REPORT_TTL_DEFAULT;

// ============================================================================
// Specifications
// ============================================================================

/// Settings shared by read and write databases, as written by users
const IncomingSpec& per_database_config_in();

/// Write-database settings (shared settings plus retention and migration)
const IncomingSpec& per_write_database_config_in();

/// Resolved shared database settings
const OutgoingSpec& per_database_config_out();

/// Resolved write-database settings; subname is optional here and
/// enforced by validate_db_settings
const OutgoingSpec& per_write_database_config_out();

// ============================================================================
// Profiles
// ============================================================================

/**
 * @brief Resolved [database] section
 */
struct DatabaseProfiles {
    /// The sectionwide profile
    ResolvedSection primary;

    /// Profiles of the [database "name"] subsections
    std::map<std::string, ResolvedSection> named;

    /**
     * @brief Find a named profile
     * @return Pointer to the profile, or nullptr if absent
     */
    const ResolvedSection* find(const std::string& name) const {
        auto it = named.find(name);
        return it == named.end() ? nullptr : &it->second;
    }
};

/**
 * @brief Outcome of configure_db()
 */
struct DatabaseResolution {
    DatabaseProfiles database;
    ResolvedSection read_database;

    /// Document entries that are not database sections
    Value passthrough = Value::object();
};

// ============================================================================
// Steps
// ============================================================================

/**
 * @brief Diagnostic label of a database profile
 * @return `database` or `database "name"`
 */
std::string database_label(const std::optional<std::string>& db_name);

/**
 * @brief Cascade transform: subsection settings over raw sectionwide settings
 */
Value populate_db_subsections(const std::optional<std::string>& db_name,
                              const Value& sectionwide, const Value& settings);

/**
 * @brief Default resource-events-ttl to report-ttl
 */
ResolvedSection default_events_ttl(ResolvedSection profile);

/**
 * @brief Reconcile user and username
 *
 * If both are set and differ, warns and keeps user. Afterwards both fields
 * hold the same value, or neither is set.
 */
ResolvedSection prefer_db_user_on_username_mismatch(ResolvedSection profile,
                                                    const std::optional<std::string>& db_name);

/**
 * @brief Default migrator credentials to the connection credentials
 *
 * Must run after prefer_db_user_on_username_mismatch().
 * @throws InvariantError if username is set but user is not
 */
ResolvedSection ensure_migrator_info(ResolvedSection profile);

/**
 * @brief Fix-up transform: convert a cascaded profile and derive its fields
 */
ResolvedSection fix_up_db_subsection(const std::optional<std::string>& db_name,
                                     const ResolvedSection& sectionwide, const Value& settings);

/**
 * @brief Cross-field checks on every database profile
 *
 * Regex facts-blacklist patterns are only compiled to check them; the
 * profile keeps the list as strings and consumers compile what they use.
 *
 * @throws InvariantError if a profile has a blank subname, if
 *         resource-events-ttl is longer than report-ttl, or if a regex
 *         facts-blacklist pattern does not compile
 */
void validate_db_settings(const DatabaseProfiles& profiles);

/**
 * @brief Resolve [read-database], or derive it from the primary profile
 *
 * @param read_database Raw [read-database] settings, or nullptr if absent
 * @param profiles Fully resolved database profiles
 */
ResolvedSection configure_read_db(const Value* read_database, const DatabaseProfiles& profiles);

/**
 * @brief Resolve all database sections of a document.
 *
 * @param document Raw top-level entries
 * @return Database profiles, read profile and the remaining entries
 * @throws ConfigError on any grammar, structure, schema, conversion or
 *         invariant error
 */
DatabaseResolution configure_db(const RawEntries& document);

} // namespace confres

#endif // CONFRES_DATABASE_HPP
