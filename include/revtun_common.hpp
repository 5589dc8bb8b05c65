#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <boost/program_options.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common_macros.hpp"
#include "my_error_codes.hpp"
#include "revtun_errors.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace revtun {

struct CliParams {
  std::vector<fs::path> config_dirs;
  std::vector<std::string> profiles;
  fs::path runtime_dir;
  std::string subcmd;
  std::string verbose; // vvvv
  bool silent = false;
  bool allow_non_root = false;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  std::vector<std::string> unrecognized;
  revtun::CliParams params;
  CliCtx(po::variables_map &&vm,                  //
         std::vector<std::string> &&positionals,  //
         std::vector<std::string> &&unrecognized, //
         revtun::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        unrecognized(std::move(unrecognized)), params(std::move(params_)) {}
  // True iff the option exists in variables_map and was not defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }
  bool positional_contains(const std::string &name) const {
    return std::find(positionals.begin(), positionals.end(), name) !=
           positionals.end();
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }
  ~CliCtx() { DEBUG_PRINT("CliCtx destroyed"); }

  // Positional following `subcmd`, e.g. "remote" in `render remote`.
  std::optional<std::string> action() const {
    if (positionals.size() < 2) {
      return std::nullopt;
    }
    return positionals[1];
  }

  bool is_set() const { return positional_contains("set"); }
  bool is_get() const { return positional_contains("get"); }

  // revtun conf set wg_port 51820
  std::pair<std::string, std::string> get_set_kv() const {
    size_t set_pos{0};
    for (const auto &p : positionals) {
      if (p == "set") {
        break;
      }
      set_pos++;
    }
    if (set_pos + 2 >= positionals.size()) {
      throw RevtunError(
          my_errors::GENERAL::SHOW_OPT_DESC,
          "Both key and value must be provided for set operation.");
    }
    return {positionals[set_pos + 1], positionals[set_pos + 2]};
  }

  // revtun conf get wg_port
  std::string get_get_k() const {
    size_t get_pos{0};
    for (const auto &p : positionals) {
      if (p == "get") {
        break;
      }
      get_pos++;
    }
    if (get_pos + 1 >= positionals.size()) {
      throw RevtunError(my_errors::GENERAL::SHOW_OPT_DESC,
                        "Key must be provided for get operation.");
    }
    return positionals[get_pos + 1];
  }

  size_t positional_count() const { return positionals.size(); }
};

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 5> kKnown{
      "up", "down", "status", "render", "conf"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

inline std::optional<size_t>
find_subcommand_index(const std::vector<std::string> &tokens) {
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (is_known_subcommand(tokens[i])) {
      return i;
    }
  }
  return std::nullopt;
}

// True when `token` directly follows an option flag in `raw_tokens`, i.e. it
// is that option's value ("wg1" in `--interface wg1`).
inline bool is_option_value(const std::string &token,
                            const std::vector<std::string> &raw_tokens) {
  auto is_flag = [](const std::string &t) { return !t.empty() && t[0] == '-'; };
  if (token.empty()) {
    return false;
  }
  for (size_t i = 1; i < raw_tokens.size(); ++i) {
    if (raw_tokens[i] == token && is_flag(raw_tokens[i - 1])) {
      return true;
    }
  }
  return false;
}

// Resolves the subcommand and leaves it as positionals[0].
//   1. an explicit `subcmd` wins unless it is really an option value;
//   2. otherwise the first known name among `positionals`;
//   3. otherwise the first known name among `raw_tokens`, together with the
//      non-flag tokens that follow it.
inline void normalize_cli_subcommand(
    std::string &subcmd, std::vector<std::string> &positionals,
    const std::vector<std::string> &raw_tokens = {}) {
  auto put_first = [&positionals](const std::string &name) {
    auto it = std::find(positionals.begin(), positionals.end(), name);
    if (it == positionals.begin()) {
      return;
    }
    if (it != positionals.end()) {
      positionals.erase(it);
    }
    positionals.insert(positionals.begin(), name);
  };

  if (!subcmd.empty()) {
    if (is_known_subcommand(subcmd) || !is_option_value(subcmd, raw_tokens)) {
      if (positionals.empty() || positionals.front() != subcmd) {
        positionals.insert(positionals.begin(), subcmd);
      }
      return;
    }
    if (!positionals.empty() && positionals.front() == subcmd) {
      positionals.erase(positionals.begin());
    }
    subcmd.clear();
  }

  if (auto idx = find_subcommand_index(positionals)) {
    subcmd = positionals[*idx];
    put_first(subcmd);
    return;
  }

  auto idx = find_subcommand_index(raw_tokens);
  if (!idx) {
    return;
  }
  subcmd = raw_tokens[*idx];
  if (!positionals.empty()) {
    put_first(subcmd);
    return;
  }
  for (size_t j = *idx; j < raw_tokens.size(); ++j) {
    if (j > *idx && !raw_tokens[j].empty() && raw_tokens[j][0] == '-') {
      break;
    }
    positionals.push_back(raw_tokens[j]);
  }
}

} // namespace revtun
