#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <filesystem>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "operator_console.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"

int main(int argc, char** argv){
  try {
    SyncEngine::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".warpsync" / "settings.json");
    if(!settings->load()) return 1;
    std::string env_err;
    if(!settings->apply_environment(env_err)) {
      print_err(nullptr, "Invalid environment override {}", env_err);
      return 1;
    }

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "warpsync");
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    SyncEngine engine(settings, options);
    auto logger = engine.logger();

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start_background();
    logger->debug("Verbose logging enabled");

    // The main thread only waits: for a signal, or for the console to quit.
    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&logger](const std::error_code& ec, int signo){
      if(ec) return;
      logger->info("Received signal {}, shutting down", signo);
    });

    std::unique_ptr<OperatorConsole> console;
    if(settings->get<bool>("console")) {
      console = std::make_unique<OperatorConsole>(engine, [&signal_io](){ signal_io.stop(); });
      console->start();
    }

    signal_io.run();

    if(console) console->stop();
    engine.stop();
    shutdown_logging();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("warpsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
