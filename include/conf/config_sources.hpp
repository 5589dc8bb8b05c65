#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace revtun {
namespace fs = std::filesystem;

// Ordered set of configuration directories. For a logical name such as
// "application" every directory contributes, in order:
//   <name>.json, <name>.<profile>.json (per profile), <name>.override.json
// Top-level keys of later files replace earlier ones.
class ConfigSources {
  std::vector<fs::path> paths_;
  std::vector<std::string> profiles_;
  std::map<std::string, std::string> cli_overrides_;

public:
  ConfigSources(std::vector<fs::path> paths, std::vector<std::string> profiles,
                std::map<std::string, std::string> cli_overrides = {});

  // nullopt when no directory holds any file for `name`.
  std::optional<boost::json::object>
  json_content(const std::string &name) const;

  const std::vector<fs::path> &paths() const { return paths_; }
  const std::vector<std::string> &profiles() const { return profiles_; }

  // Where `conf set` persists values: the last (most specific) directory.
  fs::path override_file(const std::string &name = "application") const;
};

} // namespace revtun
