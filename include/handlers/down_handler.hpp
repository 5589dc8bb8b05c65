#pragma once

#include <string>

#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "tunnel/local_tunnel_controller.hpp"

namespace revtun {

// `revtun down`: removes the local interface. The server side keeps running
// under its service manager.
class DownHandler : public revtun::IHandler {
  tunnel::ILocalTunnelController &controller_;
  customio::ConsoleOutput &output_hub_;

public:
  DownHandler(tunnel::ILocalTunnelController &controller,
              customio::ConsoleOutput &output_hub)
      : controller_(controller), output_hub_(output_hub) {}

  std::string command() const override { return "down"; }

  void start() override {
    if (!controller_.is_up()) {
      output_hub_.logger().info() << "Local interface is not up.";
    }
    controller_.down();
    output_hub_.logger().info() << "Local tunnel torn down.";
  }
};

} // namespace revtun
