#include <logger.h>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace kdg {

namespace {
const char *LOGGER_NAME = "kdgraph";

std::shared_ptr<spdlog::logger> createLogger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing)
        return existing;

    auto sink   = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto result = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    result->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    result->set_level(spdlog::level::info);
    spdlog::register_logger(result);
    return result;
}
} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = createLogger();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace kdg
