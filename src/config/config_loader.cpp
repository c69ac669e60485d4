#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <absl/base/no_destructor.h>

namespace rev::config {

static std::string trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(),
                                [](unsigned char c) { return std::isspace(c); });
  auto end = std::find_if_not(s.rbegin(), s.rend(),
                              [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string{};
}

ConfigLoader& ConfigLoader::getInstance() {
  static absl::NoDestructor<ConfigLoader> instance;
  return *instance;
}

bool ConfigLoader::Load(const std::string& path) {
  std::ifstream in(path);
  if (!in) return false;

  std::string raw, section;
  while (std::getline(in, raw)) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == ';' || line[0] == '#') continue;

    if (line.front() == '[' && line.back() == ']') {
      section = trim(line.substr(1, line.size() - 2));
      continue;
    }
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;

    table_[section][trim(line.substr(0, pos))] = trim(line.substr(pos + 1));
  }
  return true;
}

std::string ConfigLoader::LoadFirst(const std::vector<std::string>& paths) {
  for (const auto& p : paths) {
    if (!p.empty() && Load(p)) return p;
  }
  return "";
}

std::string ConfigLoader::Get(const std::string& section,
                              const std::string& key,
                              const std::string& def) const {
  auto s_it = table_.find(section);
  if (s_it == table_.end()) return def;
  auto k_it = s_it->second.find(key);
  if (k_it == s_it->second.end()) return def;
  return k_it->second;
}

int ConfigLoader::GetInt(const std::string& section, const std::string& key, int def) const {
  std::string v = Get(section, key, "");
  if (v.empty()) return def;
  try {
    std::size_t used = 0;
    int parsed = std::stoi(v, &used, 10);
    return used == v.size() ? parsed : def;
  } catch (const std::exception&) {
    return def;
  }
}

bool ConfigLoader::GetBool(const std::string& section, const std::string& key, bool def) const {
  std::string v = Get(section, key, "");
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
  if (v == "false" || v == "0" || v == "no" || v == "off") return false;
  return def;
}

std::vector<std::string> ConfigLoader::GetList(const std::string& section,
                                               const std::string& key) const {
  std::vector<std::string> out;
  std::string v = Get(section, key, "");
  std::size_t start = 0;
  while (start <= v.size()) {
    auto comma = v.find(',', start);
    if (comma == std::string::npos) comma = v.size();
    std::string entry = trim(v.substr(start, comma - start));
    if (!entry.empty()) out.push_back(std::move(entry));
    start = comma + 1;
  }
  return out;
}

}  // namespace rev::config
