/**
 * @file Merge.cpp
 * @brief Implementation of settings merge
 */

#include "confres/Merge.hpp"

namespace confres {

Value merge_settings(const Value& base, const Value& override_val) {
    if (!override_val.is_object()) {
        return base.is_object() ? base : Value::object();
    }
    if (!base.is_object()) {
        return override_val;
    }

    Value result = base;
    for (auto it = override_val.begin(); it != override_val.end(); ++it) {
        // null doesn't override
        if (it.value().is_null()) continue;
        result[it.key()] = it.value();
    }
    return result;
}

} // namespace confres
