#include "payledger/common/logging.hpp"

#include <array>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace payledger {
namespace common {

namespace {

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> kLevelNames{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

std::shared_ptr<spdlog::logger> make_logger() {
  auto instance = spdlog::stderr_color_mt("payledger");
  instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
  instance->set_level(spdlog::level::warn);
  return instance;
}

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = make_logger();
  return instance;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  for (const auto& [text, level] : kLevelNames) {
    if (text == name) {
      return level;
    }
  }
  return std::nullopt;
}

}  // namespace common
}  // namespace payledger
