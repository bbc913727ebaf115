// mathedit/config/engine_config.cpp - Engine configuration implementation
//
#include "mathedit/config/engine_config.hpp"

#include <yaml-cpp/yaml.h>

#include <set>
#include <utility>

namespace mathedit
{

namespace
{

bool read_names(
  const YAML::Node & node, std::string_view key, std::set<std::string> & out, std::string & error)
{
  if (!node.IsSequence()) {
    error = "commands." + std::string(key) + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    auto name = item.as<std::string>();
    if (!name.empty() && name.front() == '\\') {
      name.erase(0, 1);
    }
    if (name.empty()) {
      error = "commands." + std::string(key) + " contains an empty name";
      return false;
    }
    out.insert(std::move(name));
  }
  return true;
}

template <typename T>
bool read_positive(const YAML::Node & section, const char * key, T & out, std::string & error)
{
  if (!section[key]) {
    return true;
  }
  const auto value = section[key].as<long long>();
  if (value <= 0) {
    error = std::string(key) + " must be a positive integer";
    return false;
  }
  out = static_cast<T>(value);
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  EngineConfig config;
  std::string error;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'limits' section
  if (root["limits"]) {
    const auto & lim = root["limits"];
    if (
      !read_positive(lim, "max_length", config.limits.max_length, error) ||
      !read_positive(lim, "max_nesting_depth", config.limits.max_nesting_depth, error) ||
      !read_positive(lim, "max_rows", config.limits.max_rows, error) ||
      !read_positive(lim, "max_cols", config.limits.max_cols, error)) {
      return ConfigLoadResult::fail("invalid limits: " + error);
    }
  }

  // Parse 'commands' section
  if (root["commands"]) {
    const auto & cmds = root["commands"];
    std::set<std::string> allow(config.commands.allow_set());
    std::set<std::string> deny(config.commands.deny_set());

    if (cmds["allow"]) {
      allow.clear();
      if (!read_names(cmds["allow"], "allow", allow, error)) {
        return ConfigLoadResult::fail(error);
      }
    }
    if (cmds["allow_extra"] && !read_names(cmds["allow_extra"], "allow_extra", allow, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (cmds["deny"]) {
      deny.clear();
      if (!read_names(cmds["deny"], "deny", deny, error)) {
        return ConfigLoadResult::fail(error);
      }
    }

    config.commands = CommandPolicy(std::move(allow), std::move(deny));

    const auto clash = config.commands.overlap();
    if (!clash.empty()) {
      std::string names;
      for (const auto & n : clash) {
        if (!names.empty()) names += ", ";
        names += n;
      }
      return ConfigLoadResult::fail("commands both allowed and denied: " + names);
    }
  }

  // Parse 'sync' section
  if (root["sync"]) {
    const auto & sync = root["sync"];
    if (
      !read_positive(sync, "textual_debounce_ms", config.sync.textual_debounce_ms, error) ||
      !read_positive(sync, "structural_debounce_ms", config.sync.structural_debounce_ms, error) ||
      !read_positive(sync, "history_depth", config.sync.history_depth, error) ||
      !read_positive(sync, "compaction_threshold", config.sync.compaction_threshold, error)) {
      return ConfigLoadResult::fail("invalid sync: " + error);
    }
  }

  // Parse 'templates' section
  if (root["templates"]) {
    if (!root["templates"].IsSequence()) {
      return ConfigLoadResult::fail("templates must be a list");
    }
    std::set<std::string> seen;
    for (const auto & t : root["templates"]) {
      if (!t.IsMap() || !t["name"] || !t["markup"]) {
        return ConfigLoadResult::fail("template entry must have 'name' and 'markup'");
      }
      TemplateConfig entry{t["name"].as<std::string>(), t["markup"].as<std::string>()};
      if (!seen.insert(entry.name).second) {
        return ConfigLoadResult::fail("duplicate template name: '" + entry.name + "'");
      }
      config.templates.push_back(std::move(entry));
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_engine_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ConfigLoadResult result;
  try {
    result = parse_root(root);
  } catch (const YAML::Exception & e) {
    // Type conversion errors (e.g. a string where a number belongs)
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  if (result.success) {
    result.config.config_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

ConfigLoadResult load_engine_config_from_string(std::string_view yaml_text)
{
  try {
    return parse_root(YAML::Load(std::string(yaml_text)));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_engine_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_engine_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace mathedit
