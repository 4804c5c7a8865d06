/**
 * @file Retirements.hpp
 * @brief Detection of retired configuration settings
 *
 * Retired settings are still accepted, but users should remove them. One of
 * them, [global] url-prefix, changes where the service is reachable, so its
 * presence is fatal: the report flags it and the caller must stop.
 */

#ifndef CONFRES_RETIREMENTS_HPP
#define CONFRES_RETIREMENTS_HPP

#include "confres/Value.hpp"

#include <string>
#include <vector>

namespace confres {

/**
 * @brief Retired settings found in a document
 */
struct RetirementReport {
    /// One message per retired setting or block found
    std::vector<std::string> warnings;

    /// Whether a retired setting requires operator intervention
    bool fatal = false;

    /// Guidance to print before stopping, set when fatal
    std::string fatal_message;
};

/**
 * @brief Scan a raw document for retired settings
 */
RetirementReport check_retirements(const Value& document);

/**
 * @brief Write every warning of a report to the diagnostic logger
 */
void log_retirements(const RetirementReport& report);

} // namespace confres

#endif // CONFRES_RETIREMENTS_HPP
