#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <unistd.h>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "node_engine.hpp"
#include "settings_manager.hpp"

std::string get_unique_display_name() {
  char hostname[256];
  if(gethostname(hostname, sizeof(hostname)) != 0) {
    strcpy(hostname, "UnknownHost");
  }
  hostname[sizeof(hostname) - 1] = '\0';
  std::stringstream ss;
  ss << hostname << "-" << getpid();
  return ss.str();
}

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "parcel");
    try {
      parser.parse(argc, argv, *settings);
    } catch(const std::invalid_argument& e) {
      std::cerr << e.what() << "\n";
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    // The data dir comes from the command line; the settings file inside it
    // is loaded next and the command line applied again on top.
    std::filesystem::path data_dir = settings->get<std::string>("data_dir");
    settings->set_settings_path(data_dir / ".config" / "settings.json");
    settings->load();
    parser.parse(argc, argv, *settings);

    NodeEngine::Options options;
    options.data_dir = data_dir;
    options.display_name = settings->get<std::string>("display_name");
    if(options.display_name.empty()) options.display_name = get_unique_display_name();

    const bool serve = settings->get<std::string>("command") == "serve";
    options.start_cli_thread = !serve;

    NodeEngine engine(settings, options);
    engine.start();

    auto logger = engine.logger();
    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    if(serve) {
      engine.start_background();
      asio::io_context signal_io;
      asio::signal_set signals(signal_io, SIGINT, SIGTERM);
      signals.async_wait([&](const std::error_code& ec, int signo){
        if(!ec) logger->info("Received signal {}, shutting down", signo);
      });
      signal_io.run();
    } else {
      engine.run();
    }
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("parcel-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
