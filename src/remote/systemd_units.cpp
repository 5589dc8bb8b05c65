#include "remote/systemd_units.hpp"

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace revtun {
namespace remote {
namespace systemd {

using stringutil::shell_quote;

namespace {
constexpr const char *kServiceSuffix = ".service";
}

std::string unit_file_name(const std::string &service) {
  const std::string suffix(kServiceSuffix);
  if (service.size() > suffix.size() &&
      service.compare(service.size() - suffix.size(), suffix.size(),
                      suffix) == 0) {
    return service;
  }
  return service + suffix;
}

std::string unit_file_path(const std::string &service) {
  return fmt::format("{}/{}", kUnitDirectory, unit_file_name(service));
}

std::string render_unit(const std::string &service,
                        const std::string &exec_start_path) {
  return fmt::format("[Unit]\n"
                     "Description=WireGuard Server Reverse Tunnel ({})\n"
                     "After=network.target\n"
                     "\n"
                     "[Service]\n"
                     "Type=simple\n"
                     "ExecStart={}\n"
                     "Restart=always\n"
                     "RestartSec=5\n"
                     "\n"
                     "[Install]\n"
                     "WantedBy=multi-user.target\n",
                     unit_file_name(service), exec_start_path);
}

std::string unit_exists_command(const std::string &service) {
  return fmt::format("test -f {}", shell_quote(unit_file_path(service)));
}

std::string install_unit_command(const std::string &service,
                                 const std::string &exec_start_path) {
  return fmt::format("if ! {exists}; then\n"
                     "cat > {path} <<'REVTUN_UNIT_EOF'\n"
                     "{unit}"
                     "REVTUN_UNIT_EOF\n"
                     "systemctl daemon-reload\n"
                     "{enable}\n"
                     "fi",
                     fmt::arg("exists", unit_exists_command(service)),
                     fmt::arg("path", shell_quote(unit_file_path(service))),
                     fmt::arg("unit", render_unit(service, exec_start_path)),
                     fmt::arg("enable", enable_command(service)));
}

std::string enable_command(const std::string &service) {
  return fmt::format("systemctl enable {}",
                     shell_quote(unit_file_name(service)));
}

std::string restart_command(const std::string &service) {
  return fmt::format("systemctl restart {}",
                     shell_quote(unit_file_name(service)));
}

std::string is_active_command(const std::string &service) {
  return fmt::format("systemctl is-active --quiet {}",
                     shell_quote(unit_file_name(service)));
}

std::string start_command(const std::string &service) {
  return fmt::format("systemctl start {}",
                     shell_quote(unit_file_name(service)));
}

} // namespace systemd
} // namespace remote
} // namespace revtun
