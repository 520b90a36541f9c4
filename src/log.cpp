#include "mimic/log.hpp"

#include <mutex>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>


namespace Mimic {

    namespace {
        constexpr const char* logger_name = "mimic";

        std::mutex g_LoggerMutex;
        std::shared_ptr<spdlog::logger> g_Logger;

        std::shared_ptr<spdlog::logger> make_default_logger() {
            if (auto existing = spdlog::get(logger_name)) return existing;
            try {
                return spdlog::stderr_color_mt(logger_name);
            } catch (const spdlog::spdlog_ex&) {
                // Registered by another thread since the lookup above
                if (auto existing = spdlog::get(logger_name)) return existing;
                throw;
            }
        }
    } // namespace

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard lock{ g_LoggerMutex };
        if (!g_Logger) g_Logger = make_default_logger();
        return g_Logger;
    }

    void set_logger(std::shared_ptr<spdlog::logger> l) {
        std::lock_guard lock{ g_LoggerMutex };
        g_Logger = std::move(l);
    }

} // namespace Mimic
