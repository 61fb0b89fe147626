#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "portal.hpp"
#include "portal_server.hpp"
#include "qr_code.hpp"
#include "settings_manager.hpp"

namespace {

std::string process_name(int argc, char** argv) {
  if(argc > 0 && argv && argv[0]) {
    return std::filesystem::path(argv[0]).filename().string();
  }
  return "laport";
}

// stdout carries nothing but the received text
void write_received_text(const std::string& text) {
  std::cout << text;
  if(text.empty() || text.back() != '\n') std::cout << '\n';
  std::cout.flush();
}

} // namespace

int main(int argc, char** argv){
  init(false);
  try {
    SettingsManager settings;
    CommandLineParser parser(process_name(argc, argv));
    try {
      parser.parse(argc, argv, settings);
      auto config_path = settings.get<std::string>("config");
      if(!config_path.empty()) {
        if(!settings.load_from_file(config_path)) {
          return 2;
        }
        // the command line wins over the file
        parser.parse(argc, argv, settings);
      }
    } catch(const UsageError& e) {
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 2;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("laport");
    logger->debug("Verbose logging enabled");

    PortalConfig config = make_portal_config(settings, std::cin);
    PortalServer server(config, logger);
    server.enable_signal_stop();
    server.start([&logger](const std::string& url) {
      logger->print_err("Visit: {} , or scan the QR code:", url);
      if(auto qr = render_qr_code(url)) {
        logger->print_err("{}", *qr);
      } else {
        logger->print_err("(QR code not available)");
      }
    });
    server.run();

    if(config.mode == PortalMode::ReceiveText) {
      auto text = server.text_slot().value();
      if(!text) {
        logger->warn("Stopped before any text was received");
        return 1;
      }
      write_received_text(*text);
    }
    return 0;
  } catch(const StartupError& e) {
    Logger logger("laport");
    logger.error("{}", e.what());
    return 1;
  } catch(std::exception& e) {
    Logger logger("laport-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
