#include "verify/connectivity_verifier.hpp"

#include "revtun_errors.hpp"

namespace revtun {
namespace verify {

ProbeReport ConnectivityVerifier::probe(const std::string &target,
                                        int attempts,
                                        std::chrono::seconds timeout_per_attempt) {
  ProbeReport report;
  output_.info() << "Testing tunnel connectivity to " << target << "...";
  for (int i = 0; i < attempts; ++i) {
    token_.throw_if_cancelled("verify");
    ++report.attempts_made;
    auto r = runner_.run({"ping", "-c", "1", "-W",
                          std::to_string(timeout_per_attempt.count()), target},
                         std::nullopt, timeout_per_attempt + std::chrono::seconds(2),
                         &token_);
    if (r.cancelled) {
      throw OperationCancelled("verify");
    }
    if (r.success()) {
      report.reachable = true;
      output_.debug() << "Probe " << report.attempts_made << " to " << target
                      << " answered";
      return report;
    }
    output_.debug() << "Probe " << report.attempts_made << " to " << target
                    << " failed: " << r.describe();
  }

  report.diagnostics = controller_.status_text();
  return report;
}

} // namespace verify
} // namespace revtun
