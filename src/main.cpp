#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <memory>
#include <string>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sorter_app.hpp"
#include "utils.hpp"

#ifndef FILE_SORTER_VERSION
#define FILE_SORTER_VERSION "unknown"
#endif

namespace {

void print_commands() {
  print_out(nullptr, "Commands:");
  print_out(nullptr, "  track PATH...              sort new files in the given directories until interrupted");
  print_out(nullptr, "  read [EXT...]              show the configured destination of every (or the given) extension");
  print_out(nullptr, "  write add EXT PATH         map an extension to a destination directory");
  print_out(nullptr, "  write remove EXT...        drop extensions from the mapping");
  print_out(nullptr, "  write json FILE            merge a JSON object of extension/path pairs");
  print_out(nullptr, "  locations [log] [config]   show where the log and configs files are");
  print_out(nullptr, "");
}

} // namespace

int main(int argc, char** argv){
  try {
    init(false);

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(default_settings_location());
    const bool settings_loaded = settings->load();

    CommandLineParser parser;
    parser.parse(argc, argv, *settings);
    if(settings->help_requested()) {
      parser.usage();
      print_commands();
      return 0;
    }
    if(settings->version_requested()) {
      print_out(nullptr, "file-sorter {}", FILE_SORTER_VERSION);
      return 0;
    }

    SorterApp::Options options;
    if(argc > 0 && argv) {
      options.arguments.assign(argv, argv + argc);
    }
    auto logger = std::make_shared<Logger>("file-sorter");
    SorterApp app(settings, options, logger);

    LogOptions log_options;
    log_options.verbose = settings->get<bool>("verbose");
    log_options.debug = settings->get<bool>("debug");
    log_options.log_file = app.log_location();
    init(log_options);
    logger->debug("Started logging at '{}'", log_file_path().string());
    if(!settings_loaded) {
      logger->debug("No saved settings at '{}', using defaults", settings->settings_path().string());
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      } else {
        logger->config("Saved settings to {}", settings->settings_path().string());
      }
    }

    return app.run();
  } catch(std::exception& e) {
    Logger logger("file-sorter-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
