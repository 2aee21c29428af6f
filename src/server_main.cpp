#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>

#include "command_line_parser.hpp"
#include "directory_store.hpp"
#include "index_server.hpp"
#include "index_service.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv) {
  try {
    auto settings = std::make_shared<SettingsManager>(SERVER_SETTINGS_SPECIFICATION);
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "server.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "p2pci_server",
                             "RFC index server");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      std::cerr << error << "\n";
      parser.usage(*settings);
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    init_logging(settings->get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("index");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    IndexServer::Options options;
    int value = 0;
    if(!settings->get_int_in_range("listen_port", 0, 65535, value, error)) {
      logger->error("{}", error);
      return 2;
    }
    options.listen_port = static_cast<uint16_t>(value);
    if(!settings->get_int_in_range("io_threads", 1, 64, value, error)) {
      logger->error("{}", error);
      return 2;
    }
    options.io_threads = static_cast<std::size_t>(value);
    if(!settings->get_int_in_range("idle_timeout_ms", 1, 24 * 60 * 60 * 1000, value, error)) {
      logger->error("{}", error);
      return 2;
    }
    options.idle_timeout = std::chrono::milliseconds(value);
    options.listen_ip = settings->get<std::string>("listen_ip");

    auto tokens = parse_token_list(settings->get<std::string>("tokens"));
    if(tokens.empty()) {
      logger->error("No protocol tokens configured");
      return 2;
    }

    DirectoryStore store;
    IndexService service(store, tokens, logger);
    IndexServer server(service, options, logger);
    server.start();
    server.start_background();

    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code&, int signal_number){
      logger->info("Received signal {}, shutting down", signal_number);
    });
    signal_io.run();

    server.stop();
    logger->info("Index server stopped with {} RFC(s) registered", store.size());
    return 0;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("server-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
