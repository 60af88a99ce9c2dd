#pragma once

#include "yaml-cpp/yaml.h"
#include "spdlog/spdlog.h"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace eure {

enum class union_tag_mode {
  Explicit, // A variant tag must be present
  Lenient,  // A missing tag is inferred from the fields present
};

struct config {
  union_tag_mode tag_mode = union_tag_mode::Explicit;
  std::size_t max_depth   = 256;
  std::size_t max_errors  = 0; // 0 = unlimited
  spdlog::level::level_enum log_level = spdlog::level::info;
  std::optional<std::filesystem::path> log_file;
};

/**
 * @brief Read settings from a YAML mapping
 *
 * Recognised keys: union-tag-mode, max-depth, max-errors, log-level, log-file.
 * Unknown keys are logged and skipped.
 */
std::expected<config, std::string> load_config(const YAML::Node &node);
std::expected<config, std::string> load_config_string(const std::string &yaml);
std::expected<config, std::string> load_config_file(const std::filesystem::path &path);

/// Installs the default logger: warnings to stderr, everything to the optional log file
std::expected<void, std::string> configure_logging(const config &cfg);

} // namespace eure
