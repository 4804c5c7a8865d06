/**
 * @file Defaults.hpp
 * @brief Host-derived default values
 *
 * Some defaults depend on the machine (thread counts, command size limits).
 * They are measured once, at startup, and passed explicitly into the section
 * specifications instead of being read from global state during conversion.
 */

#ifndef CONFRES_DEFAULTS_HPP
#define CONFRES_DEFAULTS_HPP

#include <cstdint>

namespace confres {

/**
 * @brief Machine-dependent defaults
 */
struct DefaultProviders {
    /// Half the processing units, at least 1
    std::int64_t half_the_cores = 1;

    /// Largest command accepted by default, in bytes
    std::int64_t max_command_size = 0;

    /**
     * @brief Measure the current host
     *
     * The command size limit is a 205th of the memory budget, the budget
     * being a quarter of physical memory.
     */
    static DefaultProviders detect();

    /**
     * @brief Defaults for a host with @p cores processing units and
     *        @p memory_bytes of memory budget
     */
    static DefaultProviders for_host(std::int64_t cores, std::int64_t memory_bytes);
};

} // namespace confres

#endif // CONFRES_DEFAULTS_HPP
