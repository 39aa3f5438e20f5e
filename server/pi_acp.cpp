// pi-acp: ACP over WebSocket, backed by pi in RPC mode
#include <spdlog/spdlog.h>

#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "log/log.h"
#include "piacp/piacp.hpp"

using namespace piacp;

namespace {

void print_usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [--host HOST] [--port PORT] [--config FILE]\n"
            << "\n"
            << "Environment:\n"
            << "  PI_ACP_HOST, PI_ACP_PORT, PI_ACP_MAX_CONNECTIONS, PI_ACP_PI_COMMAND,\n"
            << "  PI_CODING_AGENT_DIR, PI_ACP_LOG_LEVEL\n";
}

struct Options {
  std::optional<std::string> host;
  std::optional<uint16_t> port;
  std::optional<std::filesystem::path> config_file;
};

// Returns false (after printing why) when the process should exit
bool parse_args(int argc, char* argv[], Options& options, int& exit_code) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << flag << " needs a value\n";
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      exit_code = 0;
      return false;
    } else if (arg == "--version") {
      std::cout << "pi-acp " << PIACP_VERSION_STRING << "\n";
      exit_code = 0;
      return false;
    } else if (arg == "--host") {
      const char* value = next("--host");
      if (!value) {
        exit_code = 2;
        return false;
      }
      options.host = value;
    } else if (arg == "--port") {
      const char* value = next("--port");
      if (!value) {
        exit_code = 2;
        return false;
      }
      int port = 0;
      try {
        port = std::stoi(value);
      } catch (const std::exception&) {
        port = 0;
      }
      if (port <= 0 || port > 65535) {
        std::cerr << "invalid port: " << value << "\n";
        exit_code = 2;
        return false;
      }
      options.port = static_cast<uint16_t>(port);
    } else if (arg == "--config") {
      const char* value = next("--config");
      if (!value) {
        exit_code = 2;
        return false;
      }
      options.config_file = value;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      print_usage(argv[0]);
      exit_code = 2;
      return false;
    }
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  // ----- arguments -----
  Options options;
  int exit_code = 0;
  if (!parse_args(argc, argv, options, exit_code)) {
    return exit_code;
  }

  // ----- configuration -----
  Config config;
  if (options.config_file) {
    config = Config::load(*options.config_file);
    Config::apply_env(config);
  } else {
    config = Config::from_env();
  }
  if (options.host) config.server.host = *options.host;
  if (options.port) config.server.port = *options.port;

  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level, config.log_to_stderr);
  spdlog::info("pi-acp {} starting (pi command: {})", PIACP_VERSION_STRING, config.pi.command);

  // Writes to a closed socket or pipe surface as error codes
  std::signal(SIGPIPE, SIG_IGN);

  // ----- server -----
  asio::io_context io_ctx;

  acp::BridgeOptions bridge_options;
  bridge_options.sessions_dir = config.sessions_dir();
  bridge_options.agent_dir = config.agent_dir();
  bridge_options.spawn.command = config.pi.command;
  bridge_options.spawn.args = config.pi.args;
  bridge_options.request_timeout = std::chrono::milliseconds(config.pi.request_timeout_ms);

  auto server = net::WsServer::create(io_ctx, config.server, [bridge_options](std::shared_ptr<net::MessageChannel> channel) {
    return std::static_pointer_cast<net::ChannelHandler>(acp::AcpConnection::create(std::move(channel), bridge_options));
  });

  try {
    server->start();
  } catch (const std::exception& e) {
    spdlog::critical("[ws] could not listen on {}:{}: {}", config.server.host, config.server.port, e.what());
    std::cerr << "pi-acp: could not listen on " << config.server.host << ":" << config.server.port << ": " << e.what() << "\n";
    return 1;
  }

  // ----- shutdown -----
  asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
  auto grace = std::chrono::milliseconds(config.server.shutdown_grace_ms);
  signals.async_wait([server, grace](const asio::error_code& ec, int signo) {
    if (ec) return;
    spdlog::info("[ws] Received {}. Shutting down gracefully...", signo == SIGINT ? "SIGINT" : "SIGTERM");

    std::thread([grace] {
      std::this_thread::sleep_for(grace);
      spdlog::error("[ws] Forced shutdown");
      spdlog::default_logger()->flush();
      std::_Exit(1);
    }).detach();

    server->stop();
  });

  io_ctx.run();

  spdlog::info("[ws] Server closed");
  return 0;
}
