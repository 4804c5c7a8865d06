/**
 * @file Database.cpp
 * @brief Implementation of database section resolution
 */

#include "confres/Database.hpp"
#include "confres/Errors.hpp"
#include "confres/Log.hpp"
#include "confres/Merge.hpp"
#include "confres/SectionName.hpp"

#include <regex>

namespace confres {

const char* const REPORT_TTL_DEFAULT = "14d";

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string quoted(const std::string& s) {
    return "\"" + escape_subsection(s) + "\"";
}

void check_subname(const ResolvedSection& profile, const std::string& label) {
    const auto subname = profile.get_optional<std::string>("subname");
    if (!subname || is_blank(*subname)) {
        throw InvariantError("No subname set in the [" + label + "] config.");
    }
}

void check_events_ttl(const ResolvedSection& profile) {
    const auto events = profile.get_optional<Period>("resource-events-ttl");
    if (!events) return;
    const Period reports = profile.get_optional<Period>("report-ttl")
                               .value_or(*parse_period(REPORT_TTL_DEFAULT));
    if (period_longer(*events, reports)) {
        throw InvariantError("The setting for resource-events-ttl must not be longer than report-ttl");
    }
}

void check_facts_blacklist(const ResolvedSection& profile) {
    const auto type = profile.get_optional<std::string>("facts-blacklist-type");
    if (!type || *type != "regex") return;

    const auto patterns = profile.get_optional<StringList>("facts-blacklist");
    if (!patterns) return;

    std::string errors;
    for (const auto& pattern : *patterns) {
        try {
            std::regex{pattern};
        } catch (const std::regex_error& e) {
            errors += "\n" + pattern + ": " + e.what();
        }
    }
    if (!errors.empty()) {
        throw InvariantError("Unable to parse facts-blacklist patterns:" + errors);
    }
}

} // anonymous namespace

// ============================================================================
// Specifications
// ============================================================================

const IncomingSpec& per_database_config_in() {
    static const IncomingSpec spec{
        {"conn-max-age", in::defaulted_int(60)},
        {"conn-lifetime", in::optional_int()},
        {"maximum-pool-size", in::defaulted_int(25)},
        {"subname", in::optional_string()},
        {"user", in::optional_string()},
        {"username", in::optional_string()},
        {"password", in::optional_string()},
        {"syntax_pgs", in::optional_string()},
        {"read-only?", in::defaulted_string("false")},
        {"partition-conn-min", in::defaulted_int(1)},
        {"partition-conn-max", in::defaulted_int(25)},
        {"partition-count", in::defaulted_int(1)},
        {"stats", in::defaulted_string("true")},
        {"log-statements", in::defaulted_string("true")},
        {"connection-timeout", in::defaulted_int(3000)},
        {"facts-blacklist", in::optional_list()},
        {"facts-blacklist-type", in::defaulted_enum({"literal", "regex"}, "literal")},
        {"schema-check-interval", in::defaulted_int(30 * 1000)},
        // retired, accepted and ignored
        {"classname", in::defaulted_string("org.postgresql.Driver")},
        {"conn-keep-alive", in::optional_int()},
        {"log-slow-statements", in::optional_int()},
        {"statements-cache-size", in::optional_int()},
        {"subprotocol", in::defaulted_string("postgresql")},
    };
    return spec;
}

const IncomingSpec& per_write_database_config_in() {
    static const IncomingSpec spec = per_database_config_in().merged({
        {"gc-interval", in::defaulted_int(60)},
        {"report-ttl", in::defaulted_string(REPORT_TTL_DEFAULT)},
        {"node-purge-ttl", in::defaulted_string("14d")},
        {"node-purge-gc-batch-limit", in::defaulted_int(25)},
        {"node-ttl", in::defaulted_string("7d")},
        {"resource-events-ttl", in::optional_string()},
        {"migrate", in::defaulted_string("true")},
        {"migrator-username", in::optional_string()},
        {"migrator-password", in::optional_string()},
    });
    return spec;
}

const OutgoingSpec& per_database_config_out() {
    using T = SemanticType;
    static const OutgoingSpec spec{
        {"subname", out::required(T::String)},
        {"conn-max-age", out::required(T::Minutes)},
        {"read-only?", out::required(T::Boolean)},
        {"partition-conn-min", out::required(T::Integer)},
        {"partition-conn-max", out::required(T::Integer)},
        {"partition-count", out::required(T::Integer)},
        {"stats", out::required(T::Boolean)},
        {"log-statements", out::required(T::Boolean)},
        {"connection-timeout", out::required(T::Integer)},
        {"maximum-pool-size", out::required(T::Integer)},
        {"conn-lifetime", out::optional(T::Minutes)},
        {"user", out::optional(T::String)},
        {"username", out::optional(T::String)},
        {"password", out::optional(T::String)},
        {"syntax_pgs", out::optional(T::String)},
        {"facts-blacklist", out::optional(T::StringList)},
        {"facts-blacklist-type", out::required(T::String)},
        {"schema-check-interval", out::required(T::Integer)},
        // retired, accepted and ignored
        {"classname", out::required(T::String)},
        {"conn-keep-alive", out::optional(T::Minutes)},
        {"log-slow-statements", out::optional(T::Days)},
        {"statements-cache-size", out::optional(T::Integer)},
        {"subprotocol", out::required(T::String)},
    };
    return spec;
}

const OutgoingSpec& per_write_database_config_out() {
    using T = SemanticType;
    static const OutgoingSpec spec = per_database_config_out().merged({
        // checked by validate_db_settings, after the fix-ups
        {"subname", out::optional(T::String)},
        {"gc-interval", out::required(T::Minutes)},
        {"report-ttl", out::required(T::Period)},
        {"node-purge-ttl", out::required(T::Period)},
        {"node-purge-gc-batch-limit", out::non_negative_int()},
        {"node-ttl", out::required(T::Period)},
        {"resource-events-ttl", out::optional(T::Period)},
        {"migrate", out::required(T::Boolean)},
        {"migrator-username", out::optional(T::String)},
        {"migrator-password", out::optional(T::String)},
    });
    return spec;
}

// ============================================================================
// Steps
// ============================================================================

std::string database_label(const std::optional<std::string>& db_name) {
    return format_section_key(SectionName{"database", db_name});
}

Value populate_db_subsections(const std::optional<std::string>& db_name,
                              const Value& sectionwide, const Value& settings) {
    if (!db_name) return settings;
    return merge_settings(sectionwide, settings);
}

ResolvedSection default_events_ttl(ResolvedSection profile) {
    if (!profile.contains("resource-events-ttl")) {
        if (const FieldValue* reports = profile.find("report-ttl")) {
            profile.set("resource-events-ttl", *reports);
        }
    }
    return profile;
}

ResolvedSection prefer_db_user_on_username_mismatch(ResolvedSection profile,
                                                    const std::optional<std::string>& db_name) {
    const auto user = profile.get_optional<std::string>("user");
    const auto username = profile.get_optional<std::string>("username");

    if (user && username && *user != *username) {
        if (db_name) {
            logger()->warn("Configured {} database user {} and username {} don't match",
                           quoted(*db_name), quoted(*user), quoted(*username));
        } else {
            logger()->warn("Configured database user {} and username {} don't match",
                           quoted(*user), quoted(*username));
        }
        logger()->warn("Preferring configured user {}", quoted(*user));
    }

    const auto chosen = user ? user : username;
    if (chosen) {
        profile.set("user", *chosen);
        profile.set("username", *chosen);
    }
    return profile;
}

ResolvedSection ensure_migrator_info(ResolvedSection profile) {
    const auto user = profile.get_optional<std::string>("user");
    if (!user) {
        if (profile.contains("username")) {
            throw InvariantError("database username is set without user; "
                                 "user/username reconciliation must run first");
        }
        return profile;
    }

    if (!profile.contains("migrator-username")) {
        profile.set("migrator-username", *user);
    }
    if (!profile.contains("migrator-password")) {
        if (const FieldValue* password = profile.find("password")) {
            profile.set("migrator-password", *password);
        }
    }
    return profile;
}

ResolvedSection fix_up_db_subsection(const std::optional<std::string>& db_name,
                                     const ResolvedSection& /*sectionwide*/, const Value& settings) {
    ResolvedSection profile = convert_section(per_write_database_config_in(),
                                              per_write_database_config_out(),
                                              settings, database_label(db_name));
    profile = default_events_ttl(std::move(profile));
    profile = prefer_db_user_on_username_mismatch(std::move(profile), db_name);
    return ensure_migrator_info(std::move(profile));
}

void validate_db_settings(const DatabaseProfiles& profiles) {
    check_subname(profiles.primary, database_label(std::nullopt));
    check_events_ttl(profiles.primary);
    check_facts_blacklist(profiles.primary);

    for (const auto& [name, profile] : profiles.named) {
        check_subname(profile, database_label(name));
        check_events_ttl(profile);
        check_facts_blacklist(profile);
    }
}

ResolvedSection configure_read_db(const Value* read_database, const DatabaseProfiles& profiles) {
    if (read_database) {
        return convert_section(per_database_config_in(), per_database_config_out(),
                               *read_database, "read-database");
    }

    ResolvedSection derived = profiles.primary;
    derived.set("read-only?", true);
    derived = strip_unknown_keys(per_database_config_out(), derived);
    validate_outgoing(per_database_config_out(), derived, "read-database");
    return derived;
}

DatabaseResolution configure_db(const RawEntries& document) {
    static const std::regex database_key("database.*");

    CoalescedDocument coalesced = coalesce_sections(database_key, document);

    Section raw;
    if (const Section* found = coalesced.find("database")) {
        raw = *found;
    }

    // Populate first, so every subsection holds the sectionwide values
    // before any fix-up looks at it.
    const Section cascaded = to_section(update_section_settings<Value>(raw, populate_db_subsections));

    const SectionResult<ResolvedSection> fixed =
        update_section_settings<ResolvedSection>(cascaded, fix_up_db_subsection);

    DatabaseResolution result;
    result.database.primary = fixed.sectionwide;
    result.database.named = fixed.subsections;

    validate_db_settings(result.database);

    const Value* read_database = nullptr;
    if (coalesced.passthrough.contains("read-database")) {
        read_database = &coalesced.passthrough["read-database"];
    }
    result.read_database = configure_read_db(read_database, result.database);

    result.passthrough = coalesced.passthrough;
    result.passthrough.erase("read-database");

    // Sections that matched the pattern but are not [database]
    for (const auto& [name, section] : coalesced.sections) {
        if (name == "database") continue;
        Value& node = result.passthrough[name];
        node = section.settings;
        for (const auto& [subsection, settings] : section.subsections) {
            result.passthrough[format_section_key(SectionName{name, subsection})] = settings;
        }
    }
    return result;
}

} // namespace confres
