#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys. Accepts "--key value", "--key=value",
// "-alias value" and bare positionals bound to settings in order.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "warpsync",
                             std::vector<std::string> positional_keys = {"jobs_file", "database_path"});

  // Exits the process with status 1 on an unknown option or a rejected value.
  void parse(int argc, char* argv[], SettingsManager& settings) const;

  bool try_parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  void usage(const SettingsManager& settings) const;

private:
  enum class OptionResult { Consumed, NotAnOption, Failed };

  OptionResult apply_option(const std::vector<std::string>& args, std::size_t& i,
                            std::string name, bool long_form,
                            SettingsManager& settings, std::string& error) const;

  std::string process_name_;
  std::vector<std::string> positional_keys_;
};
