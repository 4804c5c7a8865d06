/**
 * @file test_database.cpp
 * @brief Tests for [database] and [read-database] resolution
 */

#include <gtest/gtest.h>
#include "confres/Database.hpp"
#include "confres/Errors.hpp"
#include "TestLog.hpp"

using namespace confres;

namespace {

RawEntries with_database(const Value& settings) {
    RawEntries entries;
    entries.emplace_back("database", settings);
    return entries;
}

std::string invariant_message(const RawEntries& entries) {
    try {
        configure_db(entries);
    } catch (const InvariantError& e) {
        return e.what();
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// Primary profile
// ============================================================================

TEST(ConfigureDb, PrimaryDefaults) {
    auto result = configure_db(with_database({{"subname", "//localhost:5432/pdb"}}));
    const ResolvedSection& db = result.database.primary;

    EXPECT_EQ(db.get<std::string>("subname"), "//localhost:5432/pdb");
    EXPECT_EQ(db.get<Minutes>("conn-max-age"), Minutes(60));
    EXPECT_EQ(db.get<std::int64_t>("maximum-pool-size"), 25);
    EXPECT_EQ(db.get<std::int64_t>("connection-timeout"), 3000);
    EXPECT_FALSE(db.get<bool>("read-only?"));
    EXPECT_TRUE(db.get<bool>("migrate"));
    EXPECT_EQ(db.get<Minutes>("gc-interval"), Minutes(60));
    EXPECT_EQ(db.get<Period>("report-ttl"), Period::of_days(14));
    EXPECT_EQ(db.get<Period>("node-ttl"), Period::of_days(7));
    EXPECT_EQ(db.get<Period>("node-purge-ttl"), Period::of_days(14));
    EXPECT_EQ(db.get<std::int64_t>("node-purge-gc-batch-limit"), 25);
    EXPECT_EQ(db.get<std::string>("facts-blacklist-type"), "literal");
    EXPECT_TRUE(result.database.named.empty());
}

TEST(ConfigureDb, EventsTtlDefaultsToReportTtl) {
    auto result = configure_db(with_database({{"subname", "//db/pdb"}, {"report-ttl", "3d"}}));
    EXPECT_EQ(result.database.primary.get<Period>("resource-events-ttl"), Period::of_days(3));
}

TEST(ConfigureDb, NoCredentialsNoMigrator) {
    auto result = configure_db(with_database({{"subname", "//db/pdb"}}));
    EXPECT_FALSE(result.database.primary.contains("user"));
    EXPECT_FALSE(result.database.primary.contains("migrator-username"));
}

TEST(ConfigureDb, MissingDatabaseSection) {
    EXPECT_EQ(invariant_message(RawEntries{}), "No subname set in the [database] config.");
}

TEST(ConfigureDb, EmptyDatabaseSection) {
    EXPECT_EQ(invariant_message(with_database(Value::object())),
              "No subname set in the [database] config.");
}

TEST(ConfigureDb, BlankSubname) {
    EXPECT_EQ(invariant_message(with_database({{"subname", "   "}})),
              "No subname set in the [database] config.");
}

TEST(ConfigureDb, EventsTtlLongerThanReportTtl) {
    EXPECT_EQ(invariant_message(with_database({{"subname", "//db/pdb"},
                                               {"resource-events-ttl", "30d"}})),
              "The setting for resource-events-ttl must not be longer than report-ttl");
}

TEST(ConfigureDb, EventsTtlWithinLongerReportTtl) {
    auto result = configure_db(with_database({{"subname", "//db/pdb"},
                                              {"report-ttl", "60d"},
                                              {"resource-events-ttl", "30d"}}));
    EXPECT_EQ(result.database.primary.get<Period>("resource-events-ttl"), Period::of_days(30));
}

TEST(ConfigureDb, EventsTtlComparedAcrossUnits) {
    EXPECT_EQ(invariant_message(with_database({{"subname", "//db/pdb"},
                                               {"report-ttl", "1d"},
                                               {"resource-events-ttl", "48h"}})),
              "The setting for resource-events-ttl must not be longer than report-ttl");
    EXPECT_EQ(invariant_message(with_database({{"subname", "//db/pdb"},
                                               {"resource-events-ttl", "337h"}})),
              "The setting for resource-events-ttl must not be longer than report-ttl");

    auto within = configure_db(with_database({{"subname", "//db/pdb"},
                                              {"report-ttl", "1d"},
                                              {"resource-events-ttl", "23h"}}));
    EXPECT_EQ(within.database.primary.get<Period>("resource-events-ttl"), Period::of_hours(23));

    auto equal = configure_db(with_database({{"subname", "//db/pdb"},
                                             {"resource-events-ttl", "336h"}}));
    EXPECT_EQ(equal.database.primary.get<Period>("resource-events-ttl"), Period::of_hours(336));
}

TEST(ConfigureDb, HugeEventsTtlRejected) {
    try {
        configure_db(with_database({{"subname", "//db/pdb"},
                                    {"resource-events-ttl", "99999999999999d"}}));
        FAIL() << "Expected ConversionError";
    } catch (const ConversionError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Conversion);
        EXPECT_EQ(e.key(), "resource-events-ttl");
    }
    EXPECT_THROW(configure_db(with_database({{"subname", "//db/pdb"},
                                             {"report-ttl", "9999999999999h"}})),
                 ConversionError);
}

TEST(ConfigureDb, NegativeBatchLimit) {
    EXPECT_THROW(configure_db(with_database({{"subname", "//db/pdb"},
                                             {"node-purge-gc-batch-limit", -1}})),
                 ConversionError);
}

// ============================================================================
// Credentials
// ============================================================================

TEST(ConfigureDb, UserPreferredOverUsername) {
    CapturedLog log;
    auto result = configure_db(with_database({{"subname", "//db/pdb"},
                                              {"user", "alice"},
                                              {"username", "bob"},
                                              {"password", "secret"}}));
    const ResolvedSection& db = result.database.primary;

    EXPECT_EQ(db.get<std::string>("user"), "alice");
    EXPECT_EQ(db.get<std::string>("username"), "alice");
    EXPECT_EQ(db.get<std::string>("migrator-username"), "alice");
    EXPECT_EQ(db.get<std::string>("migrator-password"), "secret");
    EXPECT_TRUE(log.contains("Configured database user \"alice\" and username \"bob\" don't match"));
    EXPECT_TRUE(log.contains("Preferring configured user \"alice\""));
}

TEST(ConfigureDb, UsernameOnly) {
    CapturedLog log;
    auto result = configure_db(with_database({{"subname", "//db/pdb"}, {"username", "bob"}}));
    const ResolvedSection& db = result.database.primary;

    EXPECT_EQ(db.get<std::string>("user"), "bob");
    EXPECT_EQ(db.get<std::string>("username"), "bob");
    EXPECT_EQ(db.get<std::string>("migrator-username"), "bob");
    EXPECT_FALSE(db.contains("migrator-password"));
    EXPECT_TRUE(log.text().empty());
}

TEST(ConfigureDb, ExplicitMigratorKept) {
    auto result = configure_db(with_database({{"subname", "//db/pdb"},
                                              {"user", "pdb"},
                                              {"password", "p"},
                                              {"migrator-username", "admin"},
                                              {"migrator-password", "q"}}));
    EXPECT_EQ(result.database.primary.get<std::string>("migrator-username"), "admin");
    EXPECT_EQ(result.database.primary.get<std::string>("migrator-password"), "q");
}

TEST(DatabaseSteps, MigratorNeedsReconciledUser) {
    ResolvedSection profile;
    profile.set("username", std::string("bob"));
    EXPECT_THROW(ensure_migrator_info(profile), InvariantError);
}

TEST(DatabaseSteps, NamedMismatchWarning) {
    CapturedLog log;
    ResolvedSection profile;
    profile.set("user", std::string("alice"));
    profile.set("username", std::string("bob"));

    auto fixed = prefer_db_user_on_username_mismatch(profile, std::string("archive"));
    EXPECT_EQ(fixed.get<std::string>("username"), "alice");
    EXPECT_TRUE(log.contains(
        "Configured \"archive\" database user \"alice\" and username \"bob\" don't match"));
}

TEST(DatabaseSteps, ExistingEventsTtlKept) {
    ResolvedSection profile;
    profile.set("report-ttl", Period::of_days(14));
    profile.set("resource-events-ttl", Period::of_days(2));
    EXPECT_EQ(default_events_ttl(profile).get<Period>("resource-events-ttl"), Period::of_days(2));
}

TEST(DatabaseSteps, Labels) {
    EXPECT_EQ(database_label(std::nullopt), "database");
    EXPECT_EQ(database_label(std::string("archive")), "database \"archive\"");
}

// ============================================================================
// Named profiles
// ============================================================================

TEST(ConfigureDb, NamedProfilesInherit) {
    RawEntries entries;
    entries.emplace_back("database", Value{{"subname", "//db/main"}, {"user", "pdb"}});
    entries.emplace_back("database \"archive\"", Value{{"subname", "//db/archive"}});
    entries.emplace_back("database \"reports\"", Value{{"report-ttl", "30d"}});

    auto result = configure_db(entries);
    ASSERT_EQ(result.database.named.size(), 2u);

    const ResolvedSection* archive = result.database.find("archive");
    ASSERT_NE(archive, nullptr);
    EXPECT_EQ(archive->get<std::string>("subname"), "//db/archive");
    EXPECT_EQ(archive->get<std::string>("user"), "pdb");
    EXPECT_EQ(archive->get<std::string>("migrator-username"), "pdb");

    const ResolvedSection* reports = result.database.find("reports");
    ASSERT_NE(reports, nullptr);
    EXPECT_EQ(reports->get<std::string>("subname"), "//db/main");
    EXPECT_EQ(reports->get<Period>("report-ttl"), Period::of_days(30));
    EXPECT_EQ(reports->get<Period>("resource-events-ttl"), Period::of_days(30));

    EXPECT_EQ(result.database.primary.get<std::string>("subname"), "//db/main");
    EXPECT_EQ(result.database.primary.get<Period>("report-ttl"), Period::of_days(14));
    EXPECT_EQ(result.database.find("missing"), nullptr);
}

TEST(ConfigureDb, NamedProfileBlankSubname) {
    RawEntries entries;
    entries.emplace_back("database", Value{{"subname", "//db/main"}});
    entries.emplace_back("database \"b\"", Value{{"subname", " "}});

    EXPECT_EQ(invariant_message(entries), "No subname set in the [database \"b\"] config.");
}

TEST(ConfigureDb, DuplicateSectionwide) {
    RawEntries entries;
    entries.emplace_back("database", Value{{"subname", "//db/one"}});
    entries.emplace_back("database \"primary\"", Value{{"subname", "//db/two"}});
    entries.emplace_back("database", Value{{"subname", "//db/three"}});

    EXPECT_THROW(configure_db(entries), DuplicateSectionError);
}

// ============================================================================
// Facts blacklist
// ============================================================================

TEST(ConfigureDb, RegexBlacklistValidated) {
    const std::string message = invariant_message(with_database({
        {"subname", "//db/pdb"},
        {"facts-blacklist", "^ok.*, ([a-z"},
        {"facts-blacklist-type", "regex"},
    }));
    EXPECT_EQ(message.rfind("Unable to parse facts-blacklist patterns:\n([a-z", 0), 0u);
}

TEST(ConfigureDb, RegexBlacklistKeptAsText) {
    auto result = configure_db(with_database({
        {"subname", "//db/pdb"},
        {"facts-blacklist", "^ok.*, sys_[0-9]+"},
        {"facts-blacklist-type", "regex"},
    }));
    EXPECT_EQ(result.database.primary.get<StringList>("facts-blacklist"),
              (StringList{"^ok.*", "sys_[0-9]+"}));
}

TEST(ConfigureDb, LiteralBlacklistNotCompiled) {
    auto result = configure_db(with_database({
        {"subname", "//db/pdb"},
        {"facts-blacklist", Value::array({"([a-z", "uptime"})},
    }));
    EXPECT_EQ(result.database.primary.get<StringList>("facts-blacklist"),
              (StringList{"([a-z", "uptime"}));
}

TEST(ConfigureDb, UnknownBlacklistType) {
    EXPECT_THROW(configure_db(with_database({{"subname", "//db/pdb"},
                                             {"facts-blacklist-type", "glob"}})),
                 SchemaError);
}

// ============================================================================
// Read database
// ============================================================================

TEST(ConfigureReadDb, SynthesizedFromPrimary) {
    auto result = configure_db(with_database({{"subname", "mydb"},
                                              {"user", "pdb"},
                                              {"password", "p"},
                                              {"maximum-pool-size", 7}}));
    const ResolvedSection& read = result.read_database;

    EXPECT_TRUE(read.get<bool>("read-only?"));
    EXPECT_EQ(read.get<std::string>("subname"), "mydb");
    EXPECT_EQ(read.get<std::string>("user"), "pdb");
    EXPECT_EQ(read.get<std::int64_t>("maximum-pool-size"), 7);
    for (const char* key : {"report-ttl", "node-ttl", "node-purge-ttl", "gc-interval", "migrate",
                            "resource-events-ttl", "migrator-username", "migrator-password"}) {
        EXPECT_FALSE(read.contains(key)) << key;
    }
    for (const auto& [key, value] : read.values()) {
        EXPECT_TRUE(per_database_config_out().contains(key)) << key;
    }
    EXPECT_FALSE(result.database.primary.get<bool>("read-only?"));
}

TEST(ConfigureReadDb, SuppliedSection) {
    RawEntries entries;
    entries.emplace_back("database", Value{{"subname", "//db/main"}});
    entries.emplace_back("read-database", Value{{"subname", "//replica/pdb"}, {"conn-max-age", 10}});

    auto result = configure_db(entries);
    const ResolvedSection& read = result.read_database;

    EXPECT_EQ(read.get<std::string>("subname"), "//replica/pdb");
    EXPECT_EQ(read.get<Minutes>("conn-max-age"), Minutes(10));
    EXPECT_FALSE(read.get<bool>("read-only?"));
    EXPECT_FALSE(read.contains("report-ttl"));
    EXPECT_FALSE(result.passthrough.contains("read-database"));
}

TEST(ConfigureReadDb, SuppliedSectionDropsWriteSettings) {
    CapturedLog log;
    RawEntries entries;
    entries.emplace_back("database", Value{{"subname", "//db/main"}});
    entries.emplace_back("read-database", Value{{"subname", "//replica/pdb"}, {"report-ttl", "1d"}});

    auto result = configure_db(entries);
    EXPECT_FALSE(result.read_database.contains("report-ttl"));
    EXPECT_TRUE(log.contains("`report-ttl` does not exist"));
}

// ============================================================================
// Other entries
// ============================================================================

TEST(ConfigureDb, OtherEntriesPassThrough) {
    RawEntries entries;
    entries.emplace_back("database", Value{{"subname", "//db/main"}});
    entries.emplace_back("database-extra", Value{{"x", 1}});
    entries.emplace_back("puppetdb", Value{{"historical-catalogs-limit", 2}});

    auto result = configure_db(entries);
    EXPECT_EQ(result.passthrough["database-extra"]["x"], 1);
    EXPECT_EQ(result.passthrough["puppetdb"]["historical-catalogs-limit"], 2);
    EXPECT_FALSE(result.passthrough.contains("database"));
}
