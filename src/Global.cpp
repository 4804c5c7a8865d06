/**
 * @file Global.cpp
 * @brief Implementation of [global] resolution
 */

#include "confres/Global.hpp"
#include "confres/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

#ifdef _WIN32
    #include <io.h>
#else
    #include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace confres {

const char* const DEFAULT_PRODUCT_NAME = "puppetdb";
const char* const DEFAULT_UPDATE_SERVER = "https://updates.puppetlabs.com/check-for-updates";

namespace {

bool is_writable(const fs::path& dir) {
#ifdef _WIN32
    return _access(dir.string().c_str(), 2) == 0;
#else
    return access(dir.c_str(), W_OK) == 0;
#endif
}

} // anonymous namespace

const IncomingSpec& global_config_in() {
    static const IncomingSpec spec{
        {"vardir", in::optional_string()},
        {"product-name", in::defaulted_string(DEFAULT_PRODUCT_NAME)},
        {"update-server", in::defaulted_string(DEFAULT_UPDATE_SERVER)},
        {"logging-config", in::optional_string()},
        // retired
        {"catalog-hash-conflict-debugging", in::optional_string()},
        {"url-prefix", in::optional_string()},
    };
    return spec;
}

const OutgoingSpec& global_config_out() {
    using T = SemanticType;
    static const OutgoingSpec spec{
        {"vardir", out::optional(T::String)},
        {"product-name", out::required(T::String)},
        {"update-server", out::required(T::String)},
        {"logging-config", out::optional(T::String)},
        {"catalog-hash-conflict-debugging", out::optional(T::String)},
        {"url-prefix", out::optional(T::String)},
    };
    return spec;
}

std::string normalize_product_name(const std::string& product_name) {
    std::string lower = product_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower != "puppetdb" && lower != "pe-puppetdb") {
        throw InvariantError("product-name " + product_name +
                             " is illegal; either puppetdb or pe-puppetdb are allowed");
    }
    return lower;
}

ResolvedSection configure_globals(const Value& document) {
    const Value settings = document.is_object() ? document.value("global", Value::object())
                                                : Value::object();
    ResolvedSection global = convert_section(global_config_in(), global_config_out(), settings, "global");
    global.set("product-name", normalize_product_name(global.get<std::string>("product-name")));
    return global;
}

void validate_vardir(const ResolvedSection& global) {
    const auto vardir = global.get_optional<std::string>("vardir");
    if (!vardir) {
        throw SchemaError("global", {"vardir"},
                          "Required setting is not specified. Please set it to a writable directory");
    }

    const fs::path dir(*vardir);
    if (!dir.is_absolute()) {
        throw InvariantError("Vardir " + *vardir + " must be an absolute path.");
    }

    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        throw FileNotFoundError(*vardir);
    }
    if (!fs::is_directory(dir, ec)) {
        throw ConfigError(ErrorKind::Io, "Vardir " + *vardir + " is not a directory.");
    }
    if (!is_writable(dir)) {
        throw ConfigError(ErrorKind::Io, "Vardir " + *vardir + " is not writable.");
    }
}

} // namespace confres
