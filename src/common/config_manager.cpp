#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

std::unordered_map<std::string, std::string> ConfigManager::values_;

namespace {

std::string Trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c); });
  const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c){ return std::isspace(c); }).base();
  return first < last ? std::string(first, last) : std::string();
}

std::string Unquote(std::string v) {
  if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
    v = v.substr(1, v.size() - 2);
  }
  return v;
}

// Runs parse over the raw value; any parse failure is reported and the
// default returned.
template <typename T, typename Parse>
T ParsedOr(const std::string& key, T default_value, const char* kind, Parse parse) {
  const auto raw = ConfigManager::Get(key);
  if (!raw) return default_value;
  try {
    size_t used = 0;
    const T value = parse(*raw, used);
    if (used == raw->size()) return value;
  } catch (const std::exception&) {
  }
  Logger::Warning("Config " + key + " is not " + kind + ": '" + *raw + "', using default");
  return default_value;
}

}

void ConfigManager::Initialize(const std::string& env_path) {
  values_.clear();
  const size_t n = LoadEnvFile(env_path);
  Logger::Debug("Loaded " + std::to_string(n) + " setting(s) from " + env_path);
}

size_t ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream in(env_path);
  if (!in) {
    Logger::Warning(".env file not found: " + env_path);
    return 0;
  }
  size_t loaded = 0;
  for (std::string line; std::getline(in, line);) {
    line = Trim(line);
    if (line.empty() || line.front() == '#') continue;
    if (line.compare(0, 7, "export ") == 0) line = Trim(line.substr(7));
    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    const std::string key = Trim(line.substr(0, eq));
    if (key.empty()) continue;
    values_[key] = Unquote(Trim(line.substr(eq + 1)));
    ++loaded;
  }
  return loaded;
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  if (auto it = values_.find(key); it != values_.end()) return it->second;
  if (const char* env = std::getenv(key.c_str())) return std::string(env);
  return std::nullopt;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  return ParsedOr(key, default_value, "an integer",
                  [](const std::string& s, size_t& used) { return std::stoi(s, &used); });
}

std::uint64_t ConfigManager::GetUint64Or(const std::string& key, std::uint64_t default_value) {
  return ParsedOr(key, default_value, "an unsigned integer", [](const std::string& s, size_t& used) {
    // stoull accepts a leading minus and wraps
    if (s.find('-') != std::string::npos) throw std::invalid_argument(s);
    return static_cast<std::uint64_t>(std::stoull(s, &used));
  });
}

bool ConfigManager::GetBoolOr(const std::string& key, bool default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  std::string s = *v;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
  if (s == "0" || s == "false" || s == "no" || s == "off") return false;
  Logger::Warning("Config " + key + " is not a boolean: '" + *v + "', using default");
  return default_value;
}

void ConfigManager::Set(const std::string& key, const std::string& value) {
  values_[key] = value;
}

void ConfigManager::Clear() {
  values_.clear();
}
