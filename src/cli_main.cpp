#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>
#include <vector>
#include "confres/Config.hpp"
#include "confres/Errors.hpp"
#include "confres/Loader.hpp"
#include "confres/Log.hpp"
#include "confres/Retirements.hpp"
#include "confres/SectionName.hpp"

using namespace confres;

namespace {

const ResolvedSection* find_section(const ResolvedConfig& cfg, const std::string& section,
                                    const std::string& subsection) {
    if (section == "database") {
        if (subsection.empty()) return &cfg.database().primary;
        return cfg.database().find(subsection);
    }
    if (!subsection.empty()) return nullptr;
    if (section == "read-database") return &cfg.read_database();
    if (section == "command-processing") return &cfg.command_processing();
    if (section == "puppetdb") return &cfg.puppetdb();
    if (section == "developer") return &cfg.developer();
    if (section == "global") return &cfg.global();
    return nullptr;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("confres", "Resolve and validate a service configuration document");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML config", cxxopts::value<std::string>())
            ("skip-vardir-check", "Do not require vardir to be a writable directory")
            ("q,quiet", "Only report errors")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: check | dump | get SECTION KEY [SUBSECTION]\n";
            return 0;
        }
        if (!result.count("config")) {
            std::cerr << "Error: --config must be provided\n";
            return 1;
        }
        if (result.count("quiet")) {
            logger()->set_level(spdlog::level::err);
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        const Value document = load_config_file(result["config"].as<std::string>());

        ResolveOptions resolve;
        resolve.validate_vardir = result.count("skip-vardir-check") == 0;

        // retired settings that need operator action stop the run
        const RetirementReport retirements = check_retirements(document);
        if (retirements.fatal) {
            log_retirements(retirements);
            std::cerr << retirements.fatal_message << "\n";
            return 1;
        }

        const ResolvedConfig cfg = ResolvedConfig::resolve(document, resolve);

        // CHECK
        if (cmd == "check") {
            std::cout << "Configuration OK";
            if (!cfg.database().named.empty()) {
                std::cout << " (" << cfg.database().named.size() << " named database profiles)";
            }
            std::cout << "\n";
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            std::cout << cfg.to_json_string(2) << "\n";
            return 0;
        }

        // GET
        if (cmd == "get") {
            if (cmdv.size() < 3) {
                std::cerr << "Error: insufficient arguments for command 'get'\n";
                return 1;
            }
            const std::string subsection = cmdv.size() > 3 ? cmdv[3] : "";
            const ResolvedSection* section = find_section(cfg, cmdv[1], subsection);
            if (!section) {
                std::cerr << "Section not found: "
                          << format_section_header(SectionName{cmdv[1], subsection.empty()
                                                                   ? std::nullopt
                                                                   : std::optional<std::string>(subsection)})
                          << "\n";
                return 1;
            }
            const FieldValue* value = section->find(cmdv[2]);
            if (!value) {
                std::cerr << "Key not found: " << cmdv[2] << "\n";
                return 1;
            }
            std::cout << render_json(*value).dump(2) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const ConfigError& err) {
        std::cerr << "Error (" << kind_name(err.kind()) << "): " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
