#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace payledger {
namespace common {

// Process-wide "payledger" logger. Writes to stderr; stdout carries the export.
std::shared_ptr<spdlog::logger> logger();

[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

}  // namespace common
}  // namespace payledger
