#include "handlers/render_handler.hpp"

#include <fmt/format.h>

#include "openssl/crypt_util.hpp"
#include "remote/systemd_units.hpp"
#include "render/tunnel_config_renderer.hpp"

namespace revtun {

void RenderHandler::start() {
  auto what = cli_ctx_.action();
  if (!what) {
    throw RevtunError(my_errors::GENERAL::SHOW_OPT_DESC, usage());
  }
  if (*what == "local") {
    emit(render::render_config(render::Role::Local, load_parameters()).text);
  } else if (*what == "remote") {
    auto artifact = synthesizer_.synthesize(load_parameters());
    emit(artifact.content);
  } else if (*what == "unit") {
    const auto &config = config_provider_.get();
    emit(remote::systemd::render_unit(config.remote_service,
                                      config.remote_script));
  } else {
    throw RevtunError(my_errors::GENERAL::SHOW_OPT_DESC,
                      fmt::format("Unknown render target: {}\n{}", *what,
                                  usage()));
  }
}

render::ProvisioningParameters RenderHandler::load_parameters() {
  const auto &config = config_provider_.get();
  auto server_key = keys_.read_remote_public_key(config.server_wg_pubfile);
  if (!server_key) {
    throw PreconditionError(
        my_errors::KEYS::RETRIEVAL_FAILED,
        fmt::format("No server public key at {}:{}; run `revtun up` first",
                    config.server_ssh_ip, config.server_wg_pubfile),
        "render");
  }
  auto client_keys = keys_.read_local_key_pair(config.client_keyfile_path(),
                                               config.client_pubfile_path());
  if (!client_keys) {
    throw PreconditionError(
        my_errors::KEYS::RETRIEVAL_FAILED,
        fmt::format("No client key pair at {}; run `revtun up` first",
                    config.client_keyfile_path().string()),
        "render");
  }
  return render::make_parameters(config, *server_key, *client_keys);
}

void RenderHandler::emit(const std::string &text) {
  output_hub_.logger().stream() << text;
  if (!text.empty() && text.back() != '\n') {
    output_hub_.logger().stream() << '\n';
  }
  output_hub_.logger().stream().flush();
  output_hub_.logger().err_stream()
      << "fingerprint: " << cryptutil::md5_hex(text) << std::endl;
}

} // namespace revtun
