#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "log.hpp"

namespace {

bool looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return true;
  return token.size() >= 2 && token[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(token[1]));
}

std::string describe_default(const nlohmann::json& row) {
  const auto& value = row.at("default");
  if(value.is_string()) return value.get<std::string>();
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name)
  : process_name_(std::move(process_name)) {}

void CommandLineParser::fail(const std::string& message) const {
  print_err(nullptr, "{}", message);
  usage();
  std::exit(1);
}

bool CommandLineParser::apply_option(const std::string& name, bool long_form, Cursor& cursor,
                                     SettingsManager& settings) const {
  const auto key = settings.resolve_key(name);
  if(!key) {
    if(long_form) fail("Unknown option --" + name);
    return false;
  }

  std::string value = "true";
  if(settings.is_bool_setting(*key)) {
    if(!cursor.done() && !looks_like_option(cursor.peek()) && parse_bool_literal(cursor.peek())) {
      value = cursor.take();
    }
  } else if(cursor.done()) {
    fail("Missing value for option '" + name + "'");
  } else {
    value = cursor.take();
  }

  std::string error;
  if(!settings.set_from_string(*key, value, error)) {
    fail("Invalid value for option '" + name + "': " + error);
  }
  return true;
}

void CommandLineParser::apply_positional(const std::string& token, std::size_t& index,
                                         SettingsManager& settings) const {
  // Everything past the last slot accumulates in the trailing list.
  const auto& key = positionals_[std::min(index, positionals_.size() - 1)];
  ++index;
  std::string error;
  if(!settings.set_from_string(key, token, error)) {
    fail("Invalid value for " + key + " '" + token + "': " + error);
  }
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);

  Cursor cursor{args};
  std::size_t positional = 0;
  bool options_ended = false;

  while(!cursor.done()) {
    const std::string token = cursor.take();
    if(!options_ended) {
      if(token == "--") {
        options_ended = true;
        continue;
      }
      if(token.rfind("--", 0) == 0) {
        apply_option(token.substr(2), true, cursor, settings);
        continue;
      }
      // An unknown short token such as "-odd-name" is an operand.
      if(token.size() > 1 && token[0] == '-' && apply_option(token.substr(1), false, cursor, settings)) {
        continue;
      }
    }
    apply_positional(token, positional, settings);
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "Usage: {} [options] <command> [operands...]", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& row : SETTINGS_SPECIFICATION) {
    const auto key = row.at("key").get<std::string>();
    if(std::find(positionals_.begin(), positionals_.end(), key) != positionals_.end()) continue;

    const auto type = row.at("type").get<std::string>();
    std::string names;
    for(const auto& name : row.value("names", nlohmann::json::array())) {
      names += (names.empty() ? " (-" : ", -") + name.get<std::string>();
    }
    if(!names.empty()) names += ")";

    print_out(nullptr, "  --{:<22} {:<12} {}{} [{}]",
              key,
              type == "bool" ? "[true|false]" : "<" + type + ">",
              row.value("description", ""),
              names,
              describe_default(row));
  }
  print_out(nullptr, "");
}
