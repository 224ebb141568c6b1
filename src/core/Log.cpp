#include "core/Log.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace promenade::logsys {

static std::shared_ptr<spdlog::logger> g_logger;

void init(const fs::path& logDir, spdlog::level::level_enum level)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    std::string fileNote = "<console only>";
    if (!logDir.empty()) {
        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            fileNote = "<unavailable: " + ec.message() + ">";
        } else {
            const auto file = (logDir / "promenade.log").string();
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4)); // 1MB * 4
                fileNote = file;
            } catch (const spdlog::spdlog_ex& e) {
                fileNote = std::string("<unavailable: ") + e.what() + ">";
            }
        }
    }

    g_logger = std::make_shared<spdlog::logger>("promenade", sinks.begin(), sinks.end());
    g_logger->set_level(level);
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    spdlog::info("Logging started at {}", fileNote);
}

void shutdown()
{
    if (g_logger) {
        g_logger->flush();
        g_logger.reset();
    }
}

spdlog::level::level_enum parse_level(std::string_view name, spdlog::level::level_enum fallback)
{
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return fallback;
}

} // namespace promenade::logsys
