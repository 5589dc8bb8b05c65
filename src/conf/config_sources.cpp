#include "conf/config_sources.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

#include "my_error_codes.hpp"
#include "revtun_errors.hpp"

namespace revtun {

namespace json = boost::json;

namespace {

std::optional<json::object> load_object(const fs::path &file) {
  if (!fs::exists(file)) {
    return std::nullopt;
  }
  std::ifstream ifs(file);
  if (!ifs) {
    throw PreconditionError(my_errors::GENERAL::FILE_READ_WRITE,
                            "Unable to open configuration file: " +
                                file.string());
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  boost::system::error_code ec;
  json::value jv = json::parse(content, ec);
  if (ec) {
    throw PreconditionError(my_errors::GENERAL::JSON_PARSE_ERROR,
                            "Failed to parse " + file.string() + ": " +
                                ec.message());
  }
  if (!jv.is_object()) {
    throw PreconditionError(my_errors::GENERAL::JSON_PARSE_ERROR,
                            "Configuration file is not a JSON object: " +
                                file.string());
  }
  return std::move(jv.as_object());
}

} // namespace

ConfigSources::ConfigSources(std::vector<fs::path> paths,
                             std::vector<std::string> profiles,
                             std::map<std::string, std::string> cli_overrides)
    : paths_(std::move(paths)), profiles_(std::move(profiles)),
      cli_overrides_(std::move(cli_overrides)) {}

std::optional<json::object>
ConfigSources::json_content(const std::string &name) const {
  std::optional<json::object> merged;
  auto apply_file = [&](const fs::path &file) {
    auto jo = load_object(file);
    if (!jo) {
      return;
    }
    if (!merged) {
      merged = json::object{};
    }
    for (const auto &[key, value] : *jo) {
      (*merged)[key] = value;
    }
  };

  for (const auto &dir : paths_) {
    apply_file(dir / (name + ".json"));
    for (const auto &profile : profiles_) {
      apply_file(dir / (name + "." + profile + ".json"));
    }
    apply_file(dir / (name + ".override.json"));
  }

  if (name == "application" && !cli_overrides_.empty()) {
    if (!merged) {
      merged = json::object{};
    }
    for (const auto &[key, value] : cli_overrides_) {
      (*merged)[key] = value;
    }
  }
  return merged;
}

fs::path ConfigSources::override_file(const std::string &name) const {
  if (paths_.empty()) {
    throw std::runtime_error("no configuration directories");
  }
  return paths_.back() / (name + ".override.json");
}

} // namespace revtun
