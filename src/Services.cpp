/**
 * @file Services.cpp
 * @brief Service section specifications
 */

#include "confres/Services.hpp"

#include <algorithm>

namespace confres {

IncomingSpec command_processing_config_in(const DefaultProviders& defaults) {
    const std::int64_t threads = defaults.half_the_cores;
    const std::int64_t max_command_size = defaults.max_command_size;
    return IncomingSpec{
        {"threads", in::defaulted_int([threads] { return Value(threads); })},
        {"max-command-size", in::defaulted_int([max_command_size] { return Value(max_command_size); })},
        {"reject-large-commands", in::defaulted_string("false")},
        {"concurrent-writes",
         in::defaulted_int([threads] { return Value(std::min<std::int64_t>(threads, 4)); })},
        // deprecated
        {"max-frame-size", in::defaulted_int(209715200)},
        {"store-usage", in::optional_int()},
        {"temp-usage", in::optional_int()},
        {"memory-usage", in::optional_int()},
    };
}

const OutgoingSpec& command_processing_config_out() {
    using T = SemanticType;
    static const OutgoingSpec spec{
        {"threads", out::required(T::Integer)},
        {"max-command-size", out::required(T::Integer)},
        {"reject-large-commands", out::required(T::Boolean)},
        {"concurrent-writes", out::required(T::Integer)},
        // deprecated
        {"max-frame-size", out::required(T::Integer)},
        {"memory-usage", out::optional(T::Integer)},
        {"store-usage", out::optional(T::Integer)},
        {"temp-usage", out::optional(T::Integer)},
    };
    return spec;
}

const IncomingSpec& puppetdb_config_in() {
    static const IncomingSpec spec{
        {"certificate-whitelist", in::optional_string()},
        {"historical-catalogs-limit", in::defaulted_int(0)},
        {"disable-update-checking", in::defaulted_string("false")},
        {"add-agent-report-filter", in::defaulted_string("true")},
    };
    return spec;
}

const OutgoingSpec& puppetdb_config_out() {
    using T = SemanticType;
    static const OutgoingSpec spec{
        {"certificate-whitelist", out::optional(T::String)},
        {"historical-catalogs-limit", out::required(T::Integer)},
        {"disable-update-checking", out::required(T::Boolean)},
        {"add-agent-report-filter", out::required(T::Boolean)},
    };
    return spec;
}

const IncomingSpec& developer_config_in() {
    static const IncomingSpec spec{
        {"pretty-print", in::defaulted_string("false")},
        {"max-enqueued", in::defaulted_int(1000000)},
    };
    return spec;
}

const OutgoingSpec& developer_config_out() {
    using T = SemanticType;
    static const OutgoingSpec spec{
        {"pretty-print", out::required(T::Boolean)},
        {"max-enqueued", out::required(T::Integer)},
    };
    return spec;
}

ResolvedSection configure_section(const Value& document, const std::string& section,
                                  const IncomingSpec& incoming, const OutgoingSpec& outgoing) {
    const Value settings = document.is_object() ? document.value(section, Value::object())
                                                : Value::object();
    return convert_section(incoming, outgoing, settings, section);
}

ResolvedSection configure_command_processing(const Value& document, const DefaultProviders& defaults) {
    return configure_section(document, "command-processing",
                             command_processing_config_in(defaults), command_processing_config_out());
}

ResolvedSection configure_puppetdb(const Value& document) {
    return configure_section(document, "puppetdb", puppetdb_config_in(), puppetdb_config_out());
}

ResolvedSection configure_developer(const Value& document) {
    return configure_section(document, "developer", developer_config_in(), developer_config_out());
}

} // namespace confres
