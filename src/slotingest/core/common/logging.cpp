#include <slotingest/core/common/logging.h>

#include <cstdlib>
#include <mutex>
#include <string>

namespace slotingest::logging {

namespace {

spdlog::level::level_enum level_from_env() {
    const char* env = std::getenv("SLOTINGEST_LOG_LEVEL");
    if (env == nullptr) {
        return spdlog::level::info;
    }
    std::string value(env);
    if (value == "trace") return spdlog::level::trace;
    if (value == "debug") return spdlog::level::debug;
    if (value == "info") return spdlog::level::info;
    if (value == "warn" || value == "warning") return spdlog::level::warn;
    if (value == "error") return spdlog::level::err;
    if (value == "off") return spdlog::level::off;
    return spdlog::level::info;
}

std::once_flag init_flag;

}  // namespace

void init_logger() {
    std::call_once(init_flag, [] {
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        spdlog::set_level(level_from_env());
    });
}

void set_level(spdlog::level::level_enum level) { spdlog::set_level(level); }

}  // namespace slotingest::logging
