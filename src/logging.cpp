#include "backend_client/logging.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace backend_client {

    std::shared_ptr<spdlog::logger> logger() {
        static std::mutex mtx;
        std::lock_guard<std::mutex> lock(mtx);

        const std::string name(kLoggerName);
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        return spdlog::stderr_color_mt(name);
    }

}  // namespace backend_client
