#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <iostream>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "peer_node.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv) {
  try {
    auto settings = std::make_shared<SettingsManager>(PEER_SETTINGS_SPECIFICATION);
    settings->set_settings_path(std::filesystem::current_path() / ".config" / "peer.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "p2pci_peer",
                             "RFC sharing peer: serves local RFCs and fetches others via the index server",
                             {"server_host"});
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

    PeerNode node(settings);
    auto logger = node.logger();

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    node.start_background();
    logger->print("Peer {} serving RFCs on port {}", node.peer_name(), node.listen_port());
    node.register_local_documents();
    node.run_cli();
    node.stop();
    return 0;
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("peer-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
