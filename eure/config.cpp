#include "config.hpp"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include <vector>

namespace eure {

static std::expected<std::size_t, std::string> read_count(const YAML::Node &node, const std::string &key)
{
  try {
    const auto n = node.as<long long>();
    if (n < 0)
      return std::unexpected("'" + key + "' must not be negative");
    return static_cast<std::size_t>(n);
  } catch (const YAML::Exception &) {
    return std::unexpected("'" + key + "' must be an integer");
  }
}

static std::expected<config, std::string> parse_config(const YAML::Node &node)
{
  config cfg;
  if (!node || node.IsNull())
    return cfg;
  if (!node.IsMap())
    return std::unexpected(std::string("Configuration must be a mapping"));

  for (const auto &item: node) {
    const auto key   = item.first.as<std::string>();
    const auto &data = item.second;

    if (key == "union-tag-mode") {
      const auto mode = data.IsScalar() ? data.Scalar() : std::string();
      if (mode == "explicit")
        cfg.tag_mode = union_tag_mode::Explicit;
      else if (mode == "lenient")
        cfg.tag_mode = union_tag_mode::Lenient;
      else
        return std::unexpected("'union-tag-mode' must be 'explicit' or 'lenient', got '" + mode + "'");
    } else if (key == "max-depth") {
      auto depth = read_count(data, key);
      if (!depth)
        return std::unexpected(depth.error());
      if (*depth == 0)
        return std::unexpected(std::string("'max-depth' must be at least 1"));
      cfg.max_depth = *depth;
    } else if (key == "max-errors") {
      auto count = read_count(data, key);
      if (!count)
        return std::unexpected(count.error());
      cfg.max_errors = *count;
    } else if (key == "log-level") {
      const auto name  = data.IsScalar() ? data.Scalar() : std::string();
      const auto level = spdlog::level::from_str(name);
      // from_str maps unknown names to off
      if (level == spdlog::level::off && name != "off")
        return std::unexpected("'log-level' has unknown level '" + name + "'");
      cfg.log_level = level;
    } else if (key == "log-file") {
      if (!data.IsScalar())
        return std::unexpected(std::string("'log-file' must be a path"));
      cfg.log_file = data.Scalar();
    } else {
      spdlog::warn("Ignoring unknown configuration key '{}'", key);
    }
  }
  return cfg;
}

std::expected<config, std::string> load_config(const YAML::Node &node)
{
  try {
    return parse_config(node);
  } catch (const YAML::Exception &e) {
    return std::unexpected(std::string("Invalid configuration: ") + e.what());
  }
}

std::expected<config, std::string> load_config_string(const std::string &yaml)
{
  try {
    return load_config(YAML::Load(yaml));
  } catch (const YAML::Exception &e) {
    return std::unexpected(std::string("Failed to parse configuration: ") + e.what());
  }
}

std::expected<config, std::string> load_config_file(const std::filesystem::path &path)
{
  try {
    return load_config(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception &e) {
    return std::unexpected("Failed to load " + path.string() + ": " + e.what());
  }
}

std::expected<void, std::string> configure_logging(const config &cfg)
{
  auto console_error = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_error->set_level(spdlog::level::warn);
  console_error->set_pattern("[%^%l%$]: %v");

  std::vector<spdlog::sink_ptr> sinks{ console_error };
  if (cfg.log_file) {
    try {
      auto file_log = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.log_file->string(), true);
      file_log->set_level(spdlog::level::trace);
      sinks.push_back(file_log);
    } catch (const spdlog::spdlog_ex &e) {
      return std::unexpected("Cannot open " + cfg.log_file->string() + ": " + e.what());
    }
  }

  auto eurelog = std::make_shared<spdlog::logger>("eurelog", sinks.begin(), sinks.end());
  eurelog->set_level(cfg.log_level);
  spdlog::set_default_logger(eurelog);
  return {};
}

} // namespace eure
