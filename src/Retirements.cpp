/**
 * @file Retirements.cpp
 * @brief Implementation of retired-setting detection
 */

#include "confres/Retirements.hpp"
#include "confres/Log.hpp"

#include <utility>

namespace confres {

namespace {

const std::vector<std::pair<std::string, std::string>>& retired_options() {
    static const std::vector<std::pair<std::string, std::string>> options = {
        {"command-processing", "max-frame-size"},
        {"command-processing", "memory-usage"},
        {"command-processing", "store-usage"},
        {"command-processing", "temp-usage"},
        {"database", "classname"},
        {"database", "conn-keep-alive"},
        {"database", "log-slow-statements"},
        {"database", "statements-cache-size"},
        {"database", "subprotocol"},
        {"read-database", "classname"},
        {"read-database", "conn-keep-alive"},
        {"read-database", "log-slow-statements"},
        {"read-database", "statements-cache-size"},
        {"read-database", "subprotocol"},
        {"global", "catalog-hash-conflict-debugging"},
    };
    return options;
}

bool has_option(const Value& document, const std::string& section, const std::string& key) {
    auto it = document.find(section);
    return it != document.end() && it->is_object() && it->contains(key);
}

} // anonymous namespace

RetirementReport check_retirements(const Value& document) {
    RetirementReport report;
    if (!document.is_object()) return report;

    for (const auto& [section, key] : retired_options()) {
        if (has_option(document, section, key)) {
            report.warnings.push_back("The [" + section + "] " + key +
                                      " config option has been retired and will be ignored.");
        }
    }

    if (document.contains("repl")) {
        report.warnings.push_back("The configuration block [repl] is now retired and will be ignored. "
                                  "Use [nrepl] instead. Consult the documentation for more details.");
    }

    auto global = document.find("global");
    if (global != document.end() && global->is_object()) {
        auto url_prefix = global->find("url-prefix");
        if (url_prefix != global->end() && !url_prefix->is_null() &&
            !(url_prefix->is_string() && url_prefix->get<std::string>().empty())) {
            report.fatal = true;
            report.fatal_message =
                "The configuration item `url-prefix` in the [global] section is retired, "
                "please remove this item from your config. "
                "PuppetDB has a non-configurable context route of `/pdb`. "
                "Consult the documentation for more details.";
        }
    }

    return report;
}

void log_retirements(const RetirementReport& report) {
    for (const auto& warning : report.warnings) {
        logger()->warn("{}", warning);
    }
}

} // namespace confres
