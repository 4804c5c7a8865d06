/**
 * @file Services.hpp
 * @brief Specifications and resolution of the plain service sections
 *
 * Covers [command-processing], [puppetdb] and [developer]. Each is a single
 * section without subsections that goes through convert_section() once.
 */

#ifndef CONFRES_SERVICES_HPP
#define CONFRES_SERVICES_HPP

#include "confres/Defaults.hpp"
#include "confres/Schema.hpp"
#include "confres/Value.hpp"

#include <string>

namespace confres {

/**
 * @brief Incoming [command-processing] spec; defaults come from @p defaults
 */
IncomingSpec command_processing_config_in(const DefaultProviders& defaults);
const OutgoingSpec& command_processing_config_out();

const IncomingSpec& puppetdb_config_in();
const OutgoingSpec& puppetdb_config_out();

const IncomingSpec& developer_config_in();
const OutgoingSpec& developer_config_out();

/**
 * @brief Resolve one named section of a document
 *
 * An absent section resolves like an empty one, so every default applies.
 *
 * @param document Raw document object
 * @param section Top-level key of the section
 */
ResolvedSection configure_section(const Value& document, const std::string& section,
                                  const IncomingSpec& incoming, const OutgoingSpec& outgoing);

ResolvedSection configure_command_processing(const Value& document, const DefaultProviders& defaults);
ResolvedSection configure_puppetdb(const Value& document);
ResolvedSection configure_developer(const Value& document);

} // namespace confres

#endif // CONFRES_SERVICES_HPP
