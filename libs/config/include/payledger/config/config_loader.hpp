#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace payledger {
namespace config {

struct IngestConfig {
  std::string on_malformed_row{"abort"};  // "abort" or "skip"
  bool strict_amounts{false};
};

struct ExportConfig {
  bool include_header{true};
};

struct LoggingConfig {
  std::string level{"warn"};
};

struct EngineConfig {
  IngestConfig ingest;
  ExportConfig output;
  LoggingConfig logging;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace payledger
