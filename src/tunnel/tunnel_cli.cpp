#include "tunnel/tunnel_cli.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdint>

#include "my_error_codes.hpp"
#include "revtun_errors.hpp"
#include "util/string_util.hpp"

namespace revtun {
namespace tunnel {

namespace {
constexpr std::chrono::seconds kApplyTimeout{60};
constexpr std::chrono::seconds kQueryTimeout{10};
} // namespace

void WgQuickCli::apply_interface(const fs::path &config_path) {
  auto r = runner_.run({"wg-quick", "up", config_path.string()}, std::nullopt,
                       kApplyTimeout, &token_);
  if (r.cancelled) {
    throw OperationCancelled("local up");
  }
  if (!r.success()) {
    throw RevtunError(my_errors::TUNNEL::APPLY_FAILED,
                      fmt::format("wg-quick up {} failed: {}",
                                  config_path.string(), r.describe()),
                      "local up");
  }
}

bool WgQuickCli::teardown_interface(const std::string &name) {
  // not cancellable: this is what runs after cancellation
  auto r = runner_.run({"wg-quick", "down", name}, std::nullopt, kApplyTimeout,
                       nullptr);
  return r.success();
}

std::optional<std::string> WgQuickCli::show_status(const std::string &name) {
  auto r =
      runner_.run({"wg", "show", name}, std::nullopt, kQueryTimeout, nullptr);
  if (!r.success()) {
    return std::nullopt;
  }
  return r.stdout_data;
}

std::optional<std::chrono::system_clock::time_point>
WgQuickCli::latest_handshake(const std::string &name) {
  auto r = runner_.run({"wg", "show", name, "latest-handshakes"}, std::nullopt,
                       kQueryTimeout, nullptr);
  if (!r.success()) {
    return std::nullopt;
  }
  return parse_latest_handshakes(r.stdout_data);
}

std::optional<std::chrono::system_clock::time_point>
WgQuickCli::parse_latest_handshakes(const std::string &output) {
  std::optional<std::int64_t> newest;
  for (const auto &line : stringutil::split_lines(output)) {
    auto fields = stringutil::split_trim(line, '\t');
    if (fields.size() != 2) {
      continue;
    }
    std::int64_t epoch = 0;
    const auto &s = fields[1];
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), epoch);
    // 0 means no handshake with that peer yet
    if (ec != std::errc() || ptr != s.data() + s.size() || epoch <= 0) {
      continue;
    }
    if (!newest || epoch > *newest) {
      newest = epoch;
    }
  }
  if (!newest) {
    return std::nullopt;
  }
  return std::chrono::system_clock::time_point(std::chrono::seconds(*newest));
}

} // namespace tunnel
} // namespace revtun
