#pragma once

#include <chrono>
#include <string>

#include "customio/output.hpp"
#include "exec/process_runner.hpp"
#include "tunnel/local_tunnel_controller.hpp"
#include "util/cancellation.hpp"

namespace revtun {
namespace verify {

// reachable=false is a verification failure: reported, never raised.
struct ProbeReport {
  bool reachable{false};
  int attempts_made{0};
  // interface status captured when every attempt failed
  std::string diagnostics;
};

class ConnectivityVerifier {
  exec::IProcessRunner &runner_;
  tunnel::ILocalTunnelController &controller_;
  customio::IOutput &output_;
  CancellationToken &token_;

public:
  ConnectivityVerifier(exec::IProcessRunner &runner,
                       tunnel::ILocalTunnelController &controller,
                       customio::IOutput &output, CancellationToken &token)
      : runner_(runner), controller_(controller), output_(output),
        token_(token) {}

  // Up to `attempts` single ICMP echoes; stops at the first reply.
  ProbeReport probe(const std::string &target, int attempts,
                    std::chrono::seconds timeout_per_attempt);
};

} // namespace verify
} // namespace revtun
