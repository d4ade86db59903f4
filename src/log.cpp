/**
 * @file log.cpp
 * @brief Library logger registration.
 */

#include <ppf/config.hpp>
#include <ppf/log.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ppf {

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);

    // Reuse a logger the application registered under the same name
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        return existing;
    }
    return spdlog::stderr_color_mt(LOGGER_NAME);
}

} // namespace ppf
