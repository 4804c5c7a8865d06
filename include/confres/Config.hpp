#ifndef CONFRES_CONFIG_HPP
#define CONFRES_CONFIG_HPP

#include "confres/Database.hpp"
#include "confres/Defaults.hpp"
#include "confres/Retirements.hpp"
#include "confres/Schema.hpp"
#include "confres/Value.hpp"

#include <cstdint>
#include <string>

namespace confres {

/**
 * @brief Options for resolving a document.
 */
struct ResolveOptions {
    DefaultProviders defaults = DefaultProviders::detect();
    bool validate_vardir = true;
};

/**
 * @brief Fully resolved, immutable service configuration.
 *
 * Built once by resolve() from a raw document. Every section is typed,
 * defaulted and validated; sections this library does not know about are
 * kept unchanged in passthrough().
 */
class ResolvedConfig {
public:
    // Resolve in order: retirements -> global -> developer -> vardir ->
    // database -> command-processing -> puppetdb. Retirement warnings are
    // logged; a fatal retirement is reported in retirements(), it does not
    // stop resolution.
    static ResolvedConfig resolve(const RawEntries& document, const ResolveOptions& opts = ResolveOptions());
    static ResolvedConfig resolve(const Value& document, const ResolveOptions& opts = ResolveOptions());

    // Sections
    const DatabaseProfiles& database() const noexcept { return database_; }
    const ResolvedSection& read_database() const noexcept { return read_database_; }
    const ResolvedSection& command_processing() const noexcept { return command_processing_; }
    const ResolvedSection& puppetdb() const noexcept { return puppetdb_; }
    const ResolvedSection& developer() const noexcept { return developer_; }
    const ResolvedSection& global() const noexcept { return global_; }
    const Value& passthrough() const noexcept { return passthrough_; }

    /// Retired settings found in the source document
    const RetirementReport& retirements() const noexcept { return retirements_; }

    // Accessors used by the service components
    bool foss() const;
    bool pe() const;
    std::string update_server() const;
    std::int64_t mq_thread_count() const;
    bool reject_large_commands() const;
    std::int64_t max_command_size() const;
    std::string stockpile_dir() const;

    // Serialization
    Value to_json() const;
    std::string to_json_string(int indent = 2) const;

private:
    ResolvedConfig() = default;

    DatabaseProfiles database_;
    ResolvedSection read_database_;
    ResolvedSection command_processing_;
    ResolvedSection puppetdb_;
    ResolvedSection developer_;
    ResolvedSection global_;
    Value passthrough_ = Value::object();
    RetirementReport retirements_;
};

} // namespace confres

#endif // CONFRES_CONFIG_HPP
