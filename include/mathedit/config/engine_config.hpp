// mathedit/config/engine_config.hpp - Engine configuration (mathedit.yaml)
//
// Parses and validates mathedit.yaml. Shared by the CLI and by hosts that
// embed the editor engine.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mathedit/validate/command_policy.hpp"
#include "mathedit/validate/limits.hpp"

namespace mathedit
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Sync coordinator timing and history section.
 */
struct SyncConfig
{
  uint32_t textual_debounce_ms = 300;
  uint32_t structural_debounce_ms = 100;

  /// Prior roots kept for undo
  uint32_t history_depth = 50;

  /// Arena nodes created before the coordinator compacts
  size_t compaction_threshold = 20000;
};

/**
 * One toolbar template: a named markup fragment.
 */
struct TemplateConfig
{
  std::string name;
  std::string markup;
};

/**
 * Complete engine configuration (mathedit.yaml).
 */
struct EngineConfig
{
  Limits limits;
  CommandPolicy commands = CommandPolicy::defaults();
  SyncConfig sync;
  std::vector<TemplateConfig> templates;

  /// Directory containing mathedit.yaml (empty for built-in defaults)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  EngineConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(EngineConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load configuration from a mathedit.yaml file.
 *
 * Missing sections keep their defaults. Never throws; YAML and type errors
 * come back as a failed result.
 */
[[nodiscard]] ConfigLoadResult load_engine_config(const std::filesystem::path & config_path);

/// Same as load_engine_config, from YAML text already in memory
[[nodiscard]] ConfigLoadResult load_engine_config_from_string(std::string_view yaml_text);

/**
 * Find mathedit.yaml by searching upward from `start_dir` to the
 * filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_engine_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_engine_config_file_name = "mathedit.yaml";

}  // namespace mathedit
