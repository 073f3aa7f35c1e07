#include "ghapp/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace ghapp {
namespace logger {

namespace {

std::mutex& registry_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> get_or_register() {
    if (auto existing = spdlog::get(NAME)) {
        return existing;
    }
    auto created = std::make_shared<spdlog::logger>(NAME);
    created->set_level(spdlog::level::info);
    spdlog::register_logger(created);
    return created;
}

}  // namespace

void initialize(spdlog::level::level_enum level, bool use_stdout_sink) {
    std::lock_guard<std::mutex> lock(registry_mutex());

    auto core = get_or_register();
    if (use_stdout_sink && core->sinks().empty()) {
        core->sinks().push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    core->set_level(level);
}

void attach_sink(const spdlog::sink_ptr& sink) {
    std::lock_guard<std::mutex> lock(registry_mutex());
    get_or_register()->sinks().push_back(sink);
}

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(registry_mutex());
    return get_or_register();
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str falls back to "off" for unknown names
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

}  // namespace logger
}  // namespace ghapp
