#pragma once

#include <string>

namespace revtun {
namespace remote {
namespace systemd {

inline constexpr const char *kUnitDirectory = "/etc/systemd/system";

// "wg-tunnel" and "wg-tunnel.service" both name wg-tunnel.service.
std::string unit_file_name(const std::string &service);
std::string unit_file_path(const std::string &service);

// Unit that keeps `exec_start_path` running and restarts it on exit.
std::string render_unit(const std::string &service,
                        const std::string &exec_start_path);

// Shell fragments run on the server through the remote channel. Each exits
// zero on success. Service names and paths must already be validated.
std::string unit_exists_command(const std::string &service);
// Creates the unit file only when it is absent, then daemon-reload + enable.
std::string install_unit_command(const std::string &service,
                                 const std::string &exec_start_path);
std::string enable_command(const std::string &service);
std::string restart_command(const std::string &service);
std::string is_active_command(const std::string &service);
std::string start_command(const std::string &service);

} // namespace systemd
} // namespace remote
} // namespace revtun
