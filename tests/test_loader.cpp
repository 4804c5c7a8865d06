/**
 * @file test_loader.cpp
 * @brief Tests for reading JSON and TOML configuration files
 */

#include <gtest/gtest.h>
#include "confres/Config.hpp"
#include "confres/Errors.hpp"
#include "confres/Loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace confres;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

namespace {

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("confres_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

const char* const SAMPLE_TOML = R"(
[global]
vardir = "/var/lib/pdb"

[database]
subname = "//localhost:5432/pdb"
user = "pdb"
report-ttl = "30d"

['database "archive"']
subname = "//localhost:5432/archive"

[command-processing]
threads = 2

[nrepl]
enabled = false
)";

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

TEST(LoadJsonFile, BasicDocument) {
    TempFile file(R"({"database": {"subname": "//db/pdb", "maximum-pool-size": 5}})");
    Value doc = load_json_file(file.path());
    EXPECT_EQ(doc["database"]["subname"], "//db/pdb");
    EXPECT_EQ(doc["database"]["maximum-pool-size"], 5);
}

TEST(LoadJsonFile, MissingFile) {
    EXPECT_THROW(load_json_file("/nonexistent/confres.json"), FileNotFoundError);
}

TEST(LoadJsonFile, SyntaxError) {
    TempFile file(R"({"database": {"subname": )");
    EXPECT_THROW(load_json_file(file.path()), ConfigParseError);
}

TEST(LoadJsonFile, RootMustBeObject) {
    TempFile file("[1, 2, 3]");
    try {
        load_json_file(file.path());
        FAIL() << "Expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
        EXPECT_EQ(e.file(), file.path());
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadTomlFile, QuotedSubsectionTables) {
    TempFile file(SAMPLE_TOML, ".toml");
    Value doc = load_toml_file(file.path());

    EXPECT_EQ(doc["database"]["report-ttl"], "30d");
    EXPECT_EQ(doc["database \"archive\""]["subname"], "//localhost:5432/archive");
    EXPECT_EQ(doc["command-processing"]["threads"], 2);
    EXPECT_EQ(doc["nrepl"]["enabled"], false);
}

TEST(ParseToml, ArraysAndDates) {
    Value doc = parse_toml("[database]\nfacts-blacklist = [\"a\", \"b\"]\nwhen = 2024-01-02\n");
    EXPECT_EQ(doc["database"]["facts-blacklist"], Value::array({"a", "b"}));
    EXPECT_EQ(doc["database"]["when"], "2024-01-02");
}

TEST(ParseToml, SyntaxErrorPosition) {
    try {
        parse_toml("[database]\nsubname = \n", "inline.toml");
        FAIL() << "Expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.file(), "inline.toml");
        EXPECT_EQ(e.line(), 2);
        EXPECT_GT(e.column(), 0);
    }
}

// ============================================================================
// Auto-detection
// ============================================================================

TEST(LoadConfigFile, ByExtension) {
    TempFile json(R"({"puppetdb": {"historical-catalogs-limit": 1}})", ".JSON");
    EXPECT_EQ(load_config_file(json.path())["puppetdb"]["historical-catalogs-limit"], 1);

    TempFile toml("[puppetdb]\nhistorical-catalogs-limit = 2\n", ".toml");
    EXPECT_EQ(load_config_file(toml.path())["puppetdb"]["historical-catalogs-limit"], 2);
}

TEST(LoadConfigFile, UnsupportedExtension) {
    TempFile ini("[database]\n", ".ini");
    try {
        load_config_file(ini.path());
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
}

TEST(LoadConfigFile, MissingFile) {
    EXPECT_THROW(load_config_file("/nonexistent/confres.toml"), FileNotFoundError);
}

TEST(GetFileExtension, Lowercased) {
    EXPECT_EQ(get_file_extension("/etc/pdb/config.TOML"), ".toml");
    EXPECT_EQ(get_file_extension("config"), "");
}

// ============================================================================
// Integration
// ============================================================================

TEST(LoaderIntegration, ResolveTomlDocument) {
    TempFile file(SAMPLE_TOML, ".toml");

    ResolveOptions opts;
    opts.defaults = DefaultProviders::for_host(8, 2050);
    opts.validate_vardir = false;
    auto cfg = ResolvedConfig::resolve(load_config_file(file.path()), opts);

    EXPECT_EQ(cfg.mq_thread_count(), 2);
    EXPECT_EQ(cfg.database().primary.get<Period>("report-ttl"), Period::of_days(30));

    const ResolvedSection* archive = cfg.database().find("archive");
    ASSERT_NE(archive, nullptr);
    EXPECT_EQ(archive->get<std::string>("user"), "pdb");
    EXPECT_EQ(archive->get<Period>("report-ttl"), Period::of_days(30));
    EXPECT_EQ(cfg.passthrough()["nrepl"]["enabled"], false);
}
