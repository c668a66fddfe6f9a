#include "command_line_parser.hpp"

#include <cctype>
#include <cstdlib>

#include "log.hpp"

namespace {

bool looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return true;
  return token.size() >= 2 && token[0] == '-' && std::isalpha(static_cast<unsigned char>(token[1]));
}

std::string describe_range(const SettingDefinition& def) {
  if(!def.min_value && !def.max_value) return {};
  std::string out = " [";
  if(def.min_value) out += std::to_string(*def.min_value);
  out += "..";
  if(def.max_value) out += std::to_string(*def.max_value);
  return out + "]";
}

std::string describe_aliases(const SettingDefinition& def) {
  if(def.aliases.empty()) return {};
  std::string out = " (alias:";
  for(const auto& alias : def.aliases) out += " -" + alias;
  return out + ")";
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name, std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)),
    positional_keys_(std::move(positional_keys)) {}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  std::string error;
  if(!try_parse(args, settings, error)) {
    print_err(nullptr, "{}", error);
    usage(settings);
    std::exit(1);
  }
}

CommandLineParser::OptionResult CommandLineParser::apply_option(const std::vector<std::string>& args,
                                                                std::size_t& i,
                                                                std::string name,
                                                                bool long_form,
                                                                SettingsManager& settings,
                                                                std::string& error) const {
  std::string inline_value;
  bool has_inline = false;
  const auto eq = name.find('=');
  if(long_form && eq != std::string::npos) {
    inline_value = name.substr(eq + 1);
    name = name.substr(0, eq);
    has_inline = true;
  }

  const auto* def = settings.find(name);
  if(!def) {
    if(!long_form) return OptionResult::NotAnOption;
    error = "Unknown option --" + name;
    return OptionResult::Failed;
  }

  std::string value;
  if(has_inline) {
    value = inline_value;
  } else if(def->type == SettingType::Bool) {
    // A bare flag means true; a following boolean literal is taken as its value.
    const bool next_is_bool = i + 1 < args.size() && !looks_like_option(args[i + 1]) &&
                              SettingsManager::parse_bool(args[i + 1]).has_value();
    value = next_is_bool ? args[++i] : "true";
  } else if(i + 1 < args.size()) {
    value = args[++i];
  } else {
    error = "Missing value for option '" + name + "'";
    return OptionResult::Failed;
  }

  std::string set_error;
  if(!settings.set_from_string(def->key, value, set_error)) {
    error = "Invalid value for --" + def->key + ": " + set_error;
    return OptionResult::Failed;
  }
  return OptionResult::Consumed;
}

bool CommandLineParser::try_parse(const std::vector<std::string>& args,
                                  SettingsManager& settings,
                                  std::string& error) const {
  std::size_t next_positional = 0;
  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(token.rfind("--", 0) == 0 && token.size() > 2) {
      if(apply_option(args, i, token.substr(2), true, settings, error) == OptionResult::Failed) return false;
      continue;
    }
    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      const auto result = apply_option(args, i, token.substr(1), false, settings, error);
      if(result == OptionResult::Failed) return false;
      if(result == OptionResult::Consumed) continue;
    }

    if(next_positional >= positional_keys_.size()) {
      error = "Unexpected argument '" + token + "'";
      return false;
    }
    const auto& key = positional_keys_[next_positional++];
    std::string set_error;
    if(!settings.set_from_string(key, token, set_error)) {
      error = "Invalid value for " + key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  std::string synopsis = process_name_;
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - rsync/SSH transfer orchestration daemon", process_name_);
  print_out(nullptr, "Usage: {} [--option value ...]", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& def : settings.definitions()) {
    const std::string env = def.env.empty() ? std::string() : " [env " + def.env + "]";
    print_out(nullptr, "  --{} {:<12} {}{}{}{} (default: {})",
              def.key, def.argument_hint(), def.description,
              describe_range(def), describe_aliases(def), env, def.default_as_string());
  }
  print_out(nullptr, "");
}
