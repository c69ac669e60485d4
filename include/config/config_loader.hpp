#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <absl/base/no_destructor.h>

namespace rev::config {

class ConfigLoader {
 public:
  static ConfigLoader& getInstance();

  bool Load(const std::string& path);
  /// Tries each path in order; returns the one loaded, or "" if none.
  std::string LoadFirst(const std::vector<std::string>& paths);
  void Clear() { table_.clear(); }

  std::string Get(const std::string& section,
                  const std::string& key,
                  const std::string& def) const;
  int  GetInt(const std::string& section, const std::string& key, int def) const;
  bool GetBool(const std::string& section, const std::string& key, bool def) const;
  /// Comma separated list, entries trimmed, empty entries dropped.
  std::vector<std::string> GetList(const std::string& section,
                                   const std::string& key) const;

  const std::unordered_map<std::string, std::unordered_map<std::string, std::string>>&
  DebugAll() const { return table_; }

 private:
  ConfigLoader() = default;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> table_;
  friend class absl::NoDestructor<ConfigLoader>;
};

}  // namespace rev::config
