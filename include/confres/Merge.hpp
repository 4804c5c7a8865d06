/**
 * @file Merge.hpp
 * @brief Settings-map merge used to layer configuration values
 *
 * Section settings are flat key -> value maps, so layering them is a
 * key-wise merge where the overriding map wins.
 */

#ifndef CONFRES_MERGE_HPP
#define CONFRES_MERGE_HPP

#include "confres/Value.hpp"

namespace confres {

/**
 * @brief Merge two settings maps
 *
 * Merging rules:
 * - Keys present only in one map are kept
 * - Keys present in both take the override's value
 * - A null override value does not replace the base value
 * - A non-object on either side yields the other side unchanged
 *
 * @param base Base settings (lower precedence)
 * @param override_val Override settings (higher precedence)
 * @return Merged settings
 *
 * Example:
 * ```cpp
 * Value sectionwide = {{"subname", "pdb"}, {"user", "a"}};
 * Value own = {{"user", "b"}};
 * auto result = merge_settings(sectionwide, own);
 * // Result: {"subname": "pdb", "user": "b"}
 * ```
 */
Value merge_settings(const Value& base, const Value& override_val);

} // namespace confres

#endif // CONFRES_MERGE_HPP
