/**
 * @file Log.cpp
 * @brief Diagnostic logger implementation
 */

#include "confres/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace confres {

namespace {

std::shared_ptr<spdlog::logger>& current() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> make_stderr_logger() {
    auto existing = spdlog::get("confres");
    if (existing) return existing;
    auto created = spdlog::stderr_color_mt("confres");
    created->set_pattern("%^%l%$: %v");
    return created;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& log = current();
    if (!log) log = make_stderr_logger();
    return log;
}

void set_logger(std::shared_ptr<spdlog::logger> replacement) {
    current() = replacement ? std::move(replacement) : make_stderr_logger();
}

} // namespace confres
