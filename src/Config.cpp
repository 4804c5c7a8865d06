#include "confres/Config.hpp"
#include "confres/Global.hpp"
#include "confres/SectionName.hpp"
#include "confres/Services.hpp"

#include <filesystem>

namespace confres {

ResolvedConfig ResolvedConfig::resolve(const RawEntries& document, const ResolveOptions& opts) {
    const Value merged = to_document(document);
    ResolvedConfig cfg;

    // 0) retired settings
    cfg.retirements_ = check_retirements(merged);
    log_retirements(cfg.retirements_);

    // 1) globals and developer settings
    cfg.global_ = configure_globals(merged);
    cfg.developer_ = configure_developer(merged);

    // 2) vardir
    if (opts.validate_vardir) {
        validate_vardir(cfg.global_);
    }

    // 3) database profiles, from the entries so repeated headers are seen
    DatabaseResolution db = configure_db(document);
    cfg.database_ = std::move(db.database);
    cfg.read_database_ = std::move(db.read_database);

    // 4) command processing and puppetdb
    cfg.command_processing_ = configure_command_processing(merged, opts.defaults);
    cfg.puppetdb_ = configure_puppetdb(merged);

    // 5) everything else, unchanged
    cfg.passthrough_ = std::move(db.passthrough);
    for (const std::string known : {"global", "developer", "command-processing", "puppetdb"}) {
        cfg.passthrough_.erase(known);
    }

    return cfg;
}

ResolvedConfig ResolvedConfig::resolve(const Value& document, const ResolveOptions& opts) {
    return resolve(to_entries(document), opts);
}

bool ResolvedConfig::foss() const {
    return global_.get<std::string>("product-name") == "puppetdb";
}

bool ResolvedConfig::pe() const {
    return global_.get<std::string>("product-name") == "pe-puppetdb";
}

std::string ResolvedConfig::update_server() const {
    return global_.get<std::string>("update-server");
}

std::int64_t ResolvedConfig::mq_thread_count() const {
    return command_processing_.get<std::int64_t>("threads");
}

bool ResolvedConfig::reject_large_commands() const {
    return command_processing_.get<bool>("reject-large-commands");
}

std::int64_t ResolvedConfig::max_command_size() const {
    return command_processing_.get<std::int64_t>("max-command-size");
}

std::string ResolvedConfig::stockpile_dir() const {
    const auto vardir = global_.get_optional<std::string>("vardir").value_or("");
    return (std::filesystem::path(vardir) / "stockpile").string();
}

Value ResolvedConfig::to_json() const {
    Value out = passthrough_;

    for (const auto& [name, profile] : database_.named) {
        out[format_section_key(SectionName{"database", name})] = render_json(profile);
    }
    out["database"] = render_json(database_.primary);
    out["read-database"] = render_json(read_database_);
    out["command-processing"] = render_json(command_processing_);
    out["puppetdb"] = render_json(puppetdb_);
    out["developer"] = render_json(developer_);
    out["global"] = render_json(global_);
    return out;
}

std::string ResolvedConfig::to_json_string(int indent) const {
    return to_json().dump(indent);
}

} // namespace confres
