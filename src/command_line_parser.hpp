#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager. Options are `--key`, `--name` or `-name`
// followed by a value, bool options take an optional bool literal. The
// first bare word is the command, every later one an operand.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "file-sorter");

  // Prints the problem and usage and exits with status 1 on a bad option.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct Cursor {
    const std::vector<std::string>& args;
    std::size_t next = 0;
    bool done() const { return next >= args.size(); }
    const std::string& peek() const { return args[next]; }
    const std::string& take() { return args[next++]; }
  };

  bool apply_option(const std::string& name, bool long_form, Cursor& cursor,
                    SettingsManager& settings) const;
  void apply_positional(const std::string& token, std::size_t& index,
                        SettingsManager& settings) const;
  [[noreturn]] void fail(const std::string& message) const;

  std::string process_name_;
  // Settings filled by bare words, in order. The last one is a list.
  std::vector<std::string> positionals_ = {"command", "operands"};
};
