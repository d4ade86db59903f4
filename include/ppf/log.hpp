/**
 * @file log.hpp
 * @brief Library logger.
 *
 * The library writes diagnostics through a single named spdlog logger.
 * Applications may register their own logger under LOGGER_NAME before the
 * first load to redirect output, or adjust its level afterwards.
 */

#ifndef PPF_LOG_HPP
#define PPF_LOG_HPP

#include <memory>

#include <spdlog/spdlog.h>

namespace ppf {

/**
 * @brief Get the library logger, creating it on first use.
 *
 * @return Logger registered under LOGGER_NAME
 */
std::shared_ptr<spdlog::logger> logger();

} // namespace ppf

#endif // PPF_LOG_HPP
