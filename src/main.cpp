#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <filesystem>

#include "transfer_server.hpp"
#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "log.hpp"

// Address of the interface that routes to the outside world; connecting a
// UDP socket sends no packet.
std::string get_lan_ip(asio::io_context& io, Logger& logger) {
    using asio::ip::udp;
    try {
        udp::socket socket(io);
        socket.connect(udp::endpoint(asio::ip::make_address("8.8.8.8"), 80));
        return socket.local_endpoint().address().to_string();
    } catch (const std::exception& e) {
        logger.warn("get_lan_ip() failed: {}", e.what());
        return "";
    }
}

int main(int argc, char** argv){
  try {
    TransferServer::Options options;
    options.workspace_root = std::filesystem::current_path();

    TransferServer server(nullptr, options);
    auto settings = server.settings();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "qrdrop");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    auto logger = server.logger();
    if(settings->get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    server.start();

    std::string lan_ip = settings->get<std::string>("listen_ip");
    if(lan_ip == "0.0.0.0") {
      asio::io_context lookup_io;
      auto detected = get_lan_ip(lookup_io, *logger);
      lan_ip = detected.empty() ? "localhost" : detected;
    }
    logger->print("Open http://{}:{} on your phone or desktop", lan_ip, server.listen_port());

    server.run();
    server.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("qrdrop-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
