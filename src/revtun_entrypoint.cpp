#include <boost/json.hpp>

#include "common_macros.hpp"
#include "openssl/crypt_util.hpp"
#include "revtun_common.hpp"
#include "revtun_entry.hpp"
#include "util/my_logging.hpp"
#include "version.h"
#include <boost/program_options.hpp>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>

namespace po = boost::program_options;

namespace {

namespace js = boost::json;

struct DefaultPaths {
  fs::path config_dir;
  fs::path runtime_dir;
};

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// REVTUN_CONFIG_DIR / REVTUN_RUNTIME_DIR win over REVTUN_BASE_DIR
// (<base>/config, <base>/runtime), which wins over /etc/revtun and
// /var/lib/revtun.
DefaultPaths resolve_default_paths() {
  const fs::path base = get_env_path("REVTUN_BASE_DIR");
  DefaultPaths paths{
      base.empty() ? fs::path("/etc/revtun") : base / "config",
      base.empty() ? fs::path("/var/lib/revtun") : base / "runtime"};
  if (auto dir = get_env_path("REVTUN_CONFIG_DIR"); !dir.empty()) {
    paths.config_dir = std::move(dir);
  }
  if (auto dir = get_env_path("REVTUN_RUNTIME_DIR"); !dir.empty()) {
    paths.runtime_dir = std::move(dir);
  }
  return paths;
}

void ensure_directory_exists(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec && !fs::exists(dir)) {
    throw std::runtime_error(std::string("Failed to create directory '") +
                             dir.string() + "': " + ec.message());
  }
}

void write_json_if_missing(const fs::path &file_path,
                           const js::value &content) {
  if (fs::exists(file_path)) {
    return;
  }
  ensure_directory_exists(file_path.parent_path());
  std::ofstream ofs(file_path);
  if (!ofs) {
    throw std::runtime_error("Unable to write default config file: " +
                             file_path.string());
  }
  ofs << js::serialize(content) << std::endl;
}

// Only optional keys get defaults: the deployment specific ones (server
// address, tunnel addresses, key paths, ...) must come from the operator.
bool bootstrap_default_config_dir(const fs::path &config_dir,
                                  const fs::path &runtime_dir) {
  std::error_code ec;
  fs::create_directories(config_dir, ec);
  if (ec && !fs::exists(config_dir)) {
    std::cerr << "Warning: unable to create default config directory '"
              << config_dir << "': " << ec.message() << std::endl;
    return false;
  }

  try {
    js::object application{{"verbose", "info"},
                           {"interface_name", "wg0"},
                           {"wireguard_dir", "/etc/wireguard"},
                           {"allowed_range", "10.10.10.0/24"},
                           {"keepalive_seconds", 25},
                           {"supervision_interval_seconds", 60},
                           {"runtime_dir", runtime_dir.string()}};
    write_json_if_missing(config_dir / "application.json", application);

    js::object log{{"level", "info"},
                   {"log_dir", (runtime_dir / "logs").string()},
                   {"log_file", "revtun"},
                   {"rotation_size", 10 * 1024 * 1024}};
    write_json_if_missing(config_dir / "log_config.json", log);
  } catch (const std::exception &ex) {
    std::cerr << "Warning: failed to write default configuration files: "
              << ex.what() << std::endl;
    return false;
  }

  return true;
}

// runtime_dir as configured in the merged application files, if any.
std::optional<fs::path>
find_runtime_dir_override(const std::vector<fs::path> &config_dirs,
                          const std::vector<std::string> &profiles) {
  auto app = revtun::ConfigSources(config_dirs, profiles)
                 .json_content("application");
  if (!app) {
    return std::nullopt;
  }
  const auto *rd = app->if_contains("runtime_dir");
  if (!rd || !rd->is_string() || rd->as_string().empty()) {
    return std::nullopt;
  }
  return fs::path(std::string(rd->as_string()));
}

void add_unique_path(std::vector<fs::path> &paths, const fs::path &candidate) {
  if (candidate.empty()) {
    return;
  }
  if (std::find(paths.begin(), paths.end(), candidate) == paths.end()) {
    paths.push_back(candidate);
  }
}

std::string make_session_id() {
  auto now = std::chrono::system_clock::now().time_since_epoch().count();
  return revtun::cryptutil::md5_hex(
             fmt::format("{}-{}", ::getpid(), now))
      .substr(0, 8);
}

} // namespace

int RunRevtunApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "-v" || arg == "--version" || arg == "version") {
      std::cout << REVTUN_VERSION << std::endl;
      return revtun::kExitOk;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("revtun: WireGuard reverse tunnel");

    revtun::CliParams cli_params;
    std::vector<std::string> config_dirs_args;
    std::optional<std::string> server_override;

    generic_desc.add_options() //
        ("config-dirs,c",
         po::value<std::vector<std::string>>(&config_dirs_args)
             ->multitoken()
             ->composing(),
         "paths of the configuration directories.") //
        ("profiles",
         po::value<std::vector<std::string>>(&cli_params.profiles)
             ->default_value(std::vector<std::string>{}, "")
             ->notifier([&](const std::vector<std::string> &profiles) mutable {
               if (profiles.empty()) {
                 cli_params.profiles.push_back("default");
               }
             }),
         "profiles to use from the configuration file.") //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all output.") //
        ("server",
         po::value<std::string>()->value_name("HOST")->notifier(
             [&](const std::string &value) { server_override = value; }),
         "override server_ssh_ip for this run without persisting") //
        ("no-root",
         po::bool_switch(&cli_params.allow_non_root)->default_value(false),
         "allow running without root privileges.") //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1);

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    if (!config_dirs_args.empty()) {
      cli_params.config_dirs.clear();
      for (const auto &dir_str : config_dirs_args) {
        fs::path config_dir(dir_str);
        if (!fs::exists(config_dir)) {
          std::cerr << "Config directory does not exist: " << config_dir
                    << std::endl;
          return revtun::kExitUsage;
        }
        cli_params.config_dirs.push_back(std::move(config_dir));
      }
    }

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    if (positionals.size() > 0) {
      cli_params.subcmd = positionals[0];
    }

    std::vector<std::string> unrecognized = po::collect_unrecognized(
        parsed.options, po::collect_unrecognized_mode::include_positional);

    revtun::normalize_cli_subcommand(cli_params.subcmd, positionals,
                                     unrecognized);

    auto showUsage = [&]() {
      std::cerr << generic_desc << std::endl;
      std::cerr << "Subcommands:" << std::endl
                << "  up [--once]               Provision both ends and "
                   "supervise the local interface (default)."
                << std::endl
                << "  down                      Tear down the local interface."
                << std::endl
                << "  status                    Show local and remote state."
                << std::endl
                << "  render local|remote|unit  Print a rendered artifact."
                << std::endl
                << "  conf get|set <key> [value] Read or persist a "
                   "configuration value."
                << std::endl
                << std::endl;
    };

    if (vm.count("help")) {
      showUsage();
      return revtun::kExitOk;
    }

    if (cli_params.subcmd.empty()) {
      if (!positionals.empty()) {
        std::cerr << "Unknown subcommand '" << positionals.front() << "'."
                  << std::endl;
        showUsage();
        return revtun::kExitUsage;
      }
      cli_params.subcmd = "up";
      positionals.insert(positionals.begin(), cli_params.subcmd);
    }

    if (!cli_params.allow_non_root && ::geteuid() != 0) {
      std::cerr << "revtun manages network interfaces and must run as root. "
                   "Re-run as root or pass --no-root to try anyway."
                << std::endl;
      return revtun::kExitFailure;
    }

    const DefaultPaths defaults = resolve_default_paths();
    const bool default_config_available =
        bootstrap_default_config_dir(defaults.config_dir, defaults.runtime_dir);

    std::vector<fs::path> ordered_config_dirs;
    if (default_config_available && fs::exists(defaults.config_dir)) {
      add_unique_path(ordered_config_dirs, defaults.config_dir);
    }

    for (const auto &dir : cli_params.config_dirs) {
      add_unique_path(ordered_config_dirs, dir);
    }

    if (ordered_config_dirs.empty()) {
      std::cerr << "No configuration directories found. Provide --config-dirs"
                << " or ensure the default directory '" << defaults.config_dir
                << "' is accessible." << std::endl;
      return revtun::kExitFailure;
    }

    auto runtime_override =
        find_runtime_dir_override(ordered_config_dirs, cli_params.profiles);
    fs::path resolved_runtime_dir =
        runtime_override.value_or(defaults.runtime_dir);

    try {
      ensure_directory_exists(resolved_runtime_dir);
      ensure_directory_exists(resolved_runtime_dir / "logs");
    } catch (const std::exception &ex) {
      std::cerr << "Failed to prepare runtime directory '"
                << resolved_runtime_dir << "': " << ex.what() << std::endl;
      return revtun::kExitFailure;
    }

    add_unique_path(ordered_config_dirs, resolved_runtime_dir);
    cli_params.config_dirs = ordered_config_dirs;
    cli_params.runtime_dir = resolved_runtime_dir;

    std::map<std::string, std::string> cli_overrides;
    if (server_override && !server_override->empty()) {
      cli_overrides.emplace("server_ssh_ip", *server_override);
      std::cerr << "Using server override: " << *server_override << std::endl;
    }

    static revtun::ConfigSources config_sources(
        cli_params.config_dirs, cli_params.profiles, std::move(cli_overrides));
    {
      auto log_config = config_sources.json_content("log_config");
      if (!log_config) {
        std::cerr << "Failed to load log_config.json from any configuration "
                     "directory"
                  << std::endl;
        return revtun::kExitFailure;
      }
      DEBUG_PRINT("log config: " << js::serialize(*log_config));
      revtun::LoggingConfig logging_config =
          js::value_to<revtun::LoggingConfig>(js::value(*log_config));

      revtun::init_my_log(logging_config, make_session_id());
    }

    static revtun::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                  std::move(unrecognized),
                                  std::move(cli_params));

    if (!cli_ctx.is_specified_by_user("verbose")) {
      if (auto app = config_sources.json_content("application")) {
        if (auto *v = app->if_contains("verbose");
            v && v->is_string() && !v->as_string().empty()) {
          cli_ctx.params.verbose = v->as_string().c_str();
        }
      }
    }

    return revtun::launch(config_sources, cli_ctx);
  } catch (const po::error &e) {
    std::cerr << e.what() << std::endl;
    return revtun::kExitUsage;
  } catch (const revtun::RevtunError &e) {
    std::cerr << e.to_error() << std::endl;
    return revtun::kExitFailure;
  } catch (const std::exception &e) {
    std::cerr << "revtun: " << e.what() << std::endl;
    return revtun::kExitFailure;
  }
}

int main(int argc, char *argv[]) { return RunRevtunApplication(argc, argv); }
