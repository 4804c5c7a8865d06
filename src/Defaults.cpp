/**
 * @file Defaults.cpp
 * @brief Host measurement for default values
 */

#include "confres/Defaults.hpp"

#include <algorithm>
#include <thread>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <unistd.h>
#endif

namespace confres {

namespace {

std::int64_t physical_memory_bytes() {
#ifdef _WIN32
    MEMORYSTATUSEX status;
    status.dwLength = sizeof(status);
    if (!GlobalMemoryStatusEx(&status)) return 0;
    return static_cast<std::int64_t>(status.ullTotalPhys);
#else
    const long pages = sysconf(_SC_PHYS_PAGES);
    const long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages <= 0 || page_size <= 0) return 0;
    return static_cast<std::int64_t>(pages) * page_size;
#endif
}

} // anonymous namespace

DefaultProviders DefaultProviders::for_host(std::int64_t cores, std::int64_t memory_bytes) {
    DefaultProviders d;
    d.half_the_cores = std::max<std::int64_t>(cores / 2, 1);
    d.max_command_size = std::max<std::int64_t>(memory_bytes, 0) / 205;
    return d;
}

DefaultProviders DefaultProviders::detect() {
    // hardware_concurrency() may report 0 when unknown
    const auto cores = static_cast<std::int64_t>(std::thread::hardware_concurrency());
    return for_host(cores, physical_memory_bytes() / 4);
}

} // namespace confres
