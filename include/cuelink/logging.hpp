#pragma once
/**
 * @file logging.hpp
 * @brief Logger construction. Loggers are passed in, never looked up globally.
 *
 * @details
 * Every component takes a `Logger` (shared spdlog logger) in its constructor.
 * Passing nullptr selects a shared null logger, which is what tests do unless
 * they want to see traffic.
 *
 * Level conventions used across the tree:
 * - debug: per-frame detail (lines in/out, batch flushes)
 * - info:  state transitions, arbitration decisions
 * - warn:  dropped/rejected input, security violations, socket errors
 * - error: failures that need an operator (bind failed, config unreadable)
 */

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace cuelink {

using Logger = std::shared_ptr<spdlog::logger>;

/// Colored stderr logger, not registered in spdlog's global registry.
Logger make_logger(const std::string& name = "cuelink",
                   spdlog::level::level_enum level = spdlog::level::info);

/// Shared sink-less logger.
Logger null_logger();

inline Logger or_null(Logger l) { return l ? std::move(l) : null_logger(); }

/// "trace|debug|info|warn|error|critical|off" -> level.
std::optional<spdlog::level::level_enum> parse_level(const std::string& s);

} // namespace cuelink
