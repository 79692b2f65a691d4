#pragma once

#include <memory>
#include <string_view>

#include <spdlog/logger.h>

namespace backend_client {

    /** @brief Name the library registers its spdlog logger under. */
    inline constexpr std::string_view kLoggerName{"backend_client"};

    /**
     * @brief The library logger.
     *
     * Reuses a logger the application registered under kLoggerName, or
     * creates a stderr color logger on first use.
     */
    std::shared_ptr<spdlog::logger> logger();

}  // namespace backend_client
