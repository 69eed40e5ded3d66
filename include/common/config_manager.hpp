#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <optional>

// Settings read from a .env file (KEY=VALUE, optional "export ", quoted values).
// A key missing from the file is looked up in the process environment.
// Malformed numeric values log a warning and yield the default.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static std::uint64_t GetUint64Or(const std::string& key, std::uint64_t default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);

  // test hooks
  static void Set(const std::string& key, const std::string& value);
  static void Clear();

private:
  static std::unordered_map<std::string, std::string> values_;
  static size_t LoadEnvFile(const std::string& env_path);
};
