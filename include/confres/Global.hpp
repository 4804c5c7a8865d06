/**
 * @file Global.hpp
 * @brief The [global] section: product identity, update server, vardir
 */

#ifndef CONFRES_GLOBAL_HPP
#define CONFRES_GLOBAL_HPP

#include "confres/Schema.hpp"
#include "confres/Value.hpp"

#include <string>

namespace confres {

extern const char* const DEFAULT_PRODUCT_NAME;
extern const char* const DEFAULT_UPDATE_SERVER;

const IncomingSpec& global_config_in();
const OutgoingSpec& global_config_out();

/**
 * @brief Lower-case and check a product name
 * @throws InvariantError unless the name is puppetdb or pe-puppetdb
 */
std::string normalize_product_name(const std::string& product_name);

/**
 * @brief Resolve [global], defaulting and normalizing the product name
 */
ResolvedSection configure_globals(const Value& document);

/**
 * @brief Check that vardir names an existing, writable, absolute directory
 *
 * @throws SchemaError if vardir is not set
 * @throws InvariantError if vardir is not absolute
 * @throws FileNotFoundError if vardir does not exist
 * @throws ConfigError (io) if vardir is not a writable directory
 */
void validate_vardir(const ResolvedSection& global);

} // namespace confres

#endif // CONFRES_GLOBAL_HPP
