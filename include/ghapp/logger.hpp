#pragma once

/**
 * @file logger.hpp
 * @brief spdlog-based logging for ghapp
 *
 * The library logs through a single named logger. Until the host calls
 * initialize(), that logger has no sinks and output is discarded.
 */

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace ghapp {
namespace logger {

/// Name the library's logger is registered under
constexpr const char* NAME = "ghapp";

/// Register the logger (idempotent) and set its level
void initialize(spdlog::level::level_enum level, bool use_stdout_sink = true);

/// Attach an additional sink, e.g. a test sink or a file sink
void attach_sink(const spdlog::sink_ptr& sink);

/// The library logger; registered on first use if needed
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

/// Parse a level name ("trace" ... "off")
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

}  // namespace logger
}  // namespace ghapp
