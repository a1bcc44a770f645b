#include "payledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

#include "payledger/common/logging.hpp"

namespace payledger {
namespace config {

namespace {

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

IngestConfig parse_ingest(const toml::table& root) {
  IngestConfig cfg;
  if (auto* ingest = root["ingest"].as_table()) {
    cfg.on_malformed_row = get_str_or(*ingest, "on_malformed_row", cfg.on_malformed_row);
    cfg.strict_amounts = get_bool_or(*ingest, "strict_amounts", cfg.strict_amounts);
  }
  return cfg;
}

ExportConfig parse_export(const toml::table& root) {
  ExportConfig cfg;
  if (auto* output = root["export"].as_table()) {
    cfg.include_header = get_bool_or(*output, "include_header", cfg.include_header);
  }
  return cfg;
}

LoggingConfig parse_logging(const toml::table& root) {
  LoggingConfig cfg;
  if (auto* logging = root["logging"].as_table()) {
    cfg.level = get_str_or(*logging, "level", cfg.level);
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.ingest = parse_ingest(root);
  cfg.output = parse_export(root);
  cfg.logging = parse_logging(root);
  return cfg;
}

LoadResult finish(toml::parse_result& parse_result) {
  LoadResult result;
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = ConfigLoader::validate(result.config);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  return finish(parse_result);
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  auto parse_result = toml::parse(toml_content);
  return finish(parse_result);
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.ingest.on_malformed_row != "abort" && config.ingest.on_malformed_row != "skip") {
    errors.push_back({"ingest.on_malformed_row", "must be \"abort\" or \"skip\""});
  }

  if (!common::parse_log_level(config.logging.level)) {
    errors.push_back({"logging.level", "unknown level \"" + config.logging.level + "\""});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# payledger configuration
# Generated default configuration

[ingest]
on_malformed_row = "abort"  # abandon the rest of a stream on its first bad row
strict_amounts = false      # unparseable amounts read as zero

[export]
include_header = true

[logging]
level = "warn"
)";
}

}  // namespace config
}  // namespace payledger
