#include <gtest/gtest.h>

#include "remote/systemd_units.hpp"

using namespace revtun::remote;

TEST(SystemdUnitsTest, UnitNames) {
  EXPECT_EQ(systemd::unit_file_name("wg-reverse-tunnel"),
            "wg-reverse-tunnel.service");
  EXPECT_EQ(systemd::unit_file_name("wg-reverse-tunnel.service"),
            "wg-reverse-tunnel.service");
  EXPECT_EQ(systemd::unit_file_path("wg-reverse-tunnel"),
            "/etc/systemd/system/wg-reverse-tunnel.service");
}

TEST(SystemdUnitsTest, UnitRestartsScript) {
  auto unit = systemd::render_unit("wg-reverse-tunnel",
                                   "/usr/local/bin/wg-reverse-tunnel.sh");
  EXPECT_EQ(unit.rfind("[Unit]\n", 0), 0u);
  EXPECT_NE(unit.find("After=network.target\n"), std::string::npos);
  EXPECT_NE(unit.find("ExecStart=/usr/local/bin/wg-reverse-tunnel.sh\n"),
            std::string::npos);
  EXPECT_NE(unit.find("Restart=always\n"), std::string::npos);
  EXPECT_NE(unit.find("RestartSec=5\n"), std::string::npos);
  EXPECT_NE(unit.find("WantedBy=multi-user.target\n"), std::string::npos);
}

TEST(SystemdUnitsTest, InstallOnlyWritesMissingUnit) {
  auto cmd = systemd::install_unit_command("svc", "/opt/run.sh");
  EXPECT_EQ(cmd.rfind("if ! test -f '/etc/systemd/system/svc.service'; then\n",
                      0),
            0u);
  EXPECT_NE(cmd.find("cat > '/etc/systemd/system/svc.service' "
                     "<<'REVTUN_UNIT_EOF'\n[Unit]\n"),
            std::string::npos);
  EXPECT_NE(cmd.find("REVTUN_UNIT_EOF\nsystemctl daemon-reload\n"
                     "systemctl enable 'svc.service'\nfi"),
            std::string::npos);
}

TEST(SystemdUnitsTest, ServiceCommands) {
  EXPECT_EQ(systemd::restart_command("svc"), "systemctl restart 'svc.service'");
  EXPECT_EQ(systemd::start_command("svc"), "systemctl start 'svc.service'");
  EXPECT_EQ(systemd::is_active_command("svc"),
            "systemctl is-active --quiet 'svc.service'");
}
