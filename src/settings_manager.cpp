#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "log.hpp"

namespace {

std::string lowered(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string trimmed(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c){ return std::isspace(c); });
  auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c){ return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

SettingType type_from_string(const std::string& text) {
  if(text == "bool") return SettingType::Bool;
  if(text == "int") return SettingType::Int;
  if(text == "string") return SettingType::String;
  throw std::invalid_argument("unsupported setting type '" + text + "'");
}

std::optional<std::string> process_env(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if(!value) return std::nullopt;
  return std::string(value);
}

} // namespace

std::string SettingDefinition::argument_hint() const {
  switch(type) {
    case SettingType::Bool: return "[true|false]";
    case SettingType::Int: return "<int>";
    case SettingType::String: return "<string>";
  }
  return "<value>";
}

std::string SettingDefinition::default_as_string() const {
  if(default_value.is_boolean()) return default_value.get<bool>() ? "true" : "false";
  if(default_value.is_string()) return default_value.get<std::string>();
  return default_value.dump();
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : definitions_(parse_definitions(specification)) {
  for(const auto& def : definitions_) values_[def.key] = def.default_value;
}

std::vector<SettingDefinition> SettingsManager::parse_definitions(const nlohmann::json& specification) {
  std::vector<SettingDefinition> out;
  out.reserve(specification.size());
  for(const auto& entry : specification) {
    SettingDefinition def;
    def.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      def.aliases.push_back(lowered(alias));
    }
    def.type = type_from_string(entry.at("type").get<std::string>());
    def.default_value = entry.at("default");
    def.description = entry.value("description", "");
    def.persistent = entry.value("persistent", true);
    if(entry.contains("min")) def.min_value = entry.at("min").get<long long>();
    if(entry.contains("max")) def.max_value = entry.at("max").get<long long>();
    def.env = entry.value("env", "");
    out.push_back(std::move(def));
  }
  return out;
}

const SettingDefinition* SettingsManager::find(const std::string& token) const {
  const std::string wanted = lowered(token);
  for(const auto& def : definitions_) {
    if(wanted == lowered(def.key)) return &def;
    if(std::find(def.aliases.begin(), def.aliases.end(), wanted) != def.aliases.end()) return &def;
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* def = find(token)) return def->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* def = find(key);
  return def && def->type == SettingType::Bool;
}

std::chrono::milliseconds SettingsManager::get_millis(const std::string& key) const {
  return std::chrono::milliseconds(get<long long>(key));
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

std::optional<bool> SettingsManager::parse_bool(const std::string& text) {
  const std::string v = lowered(trimmed(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

bool SettingsManager::store(const SettingDefinition& def, const nlohmann::json& value, std::string& error) {
  switch(def.type) {
    case SettingType::Bool:
      if(value.is_boolean()) {
        values_[def.key] = value.get<bool>();
        return true;
      }
      if(value.is_number_integer()) {
        values_[def.key] = value.get<long long>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;
    case SettingType::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      const long long n = value.get<long long>();
      if(def.min_value && n < *def.min_value) {
        error = "must be >= " + std::to_string(*def.min_value);
        return false;
      }
      if(def.max_value && n > *def.max_value) {
        error = "must be <= " + std::to_string(*def.max_value);
        return false;
      }
      values_[def.key] = n;
      return true;
    }
    case SettingType::String:
      if(value.is_string()) {
        values_[def.key] = value.get<std::string>();
        return true;
      }
      error = "expected string";
      return false;
  }
  error = "unsupported type";
  return false;
}

bool SettingsManager::parse_text(const SettingDefinition& def, const std::string& text,
                                 nlohmann::json& out, std::string& error) {
  const std::string clean = trimmed(text);
  switch(def.type) {
    case SettingType::Bool: {
      auto b = parse_bool(clean);
      if(!b) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      out = *b;
      return true;
    }
    case SettingType::Int: {
      std::size_t used = 0;
      try {
        out = std::stoll(clean, &used);
      } catch(const std::exception&) {
        used = 0;
      }
      if(used == 0 || used != clean.size()) {
        error = "expected integer, got '" + clean + "'";
        return false;
      }
      return true;
    }
    case SettingType::String:
      out = clean;
      return true;
  }
  error = "unsupported type";
  return false;
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  const auto* def = find(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  nlohmann::json parsed;
  if(!parse_text(*def, value, parsed, error)) return false;
  return store(*def, parsed, error);
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  const auto* def = find(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*def, value, error);
}

bool SettingsManager::apply_environment(std::string& err, const EnvLookup& lookup) {
  const EnvLookup& env = lookup ? lookup : EnvLookup(process_env);
  for(const auto& def : definitions_) {
    if(def.env.empty()) continue;
    auto value = env(def.env);
    if(!value) continue;
    std::string error;
    if(!set_from_string(def.key, *value, error)) {
      err = def.env + " (" + def.key + "): " + error;
      return false;
    }
  }
  return true;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".warpsync" / "settings.json";
}

bool SettingsManager::load_from_file(const std::filesystem::path& path,
                                     std::vector<std::string>& warnings,
                                     std::string& err) {
  std::ifstream in(path);
  if(!in) return true;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    err = "cannot parse " + path.string() + ": " + e.what();
    return false;
  }
  if(!doc.is_object()) {
    err = path.string() + " must hold a JSON object";
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* def = find(item.key());
    if(!def) {
      warnings.push_back("unknown setting '" + item.key() + "'");
      continue;
    }
    std::string error;
    if(!store(*def, item.value(), error)) {
      warnings.push_back("ignoring " + item.key() + ": " + error);
    }
  }
  return true;
}

bool SettingsManager::save_to_file(const std::filesystem::path& path, std::string& err) const {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    err = "cannot write " + path.string();
    return false;
  }
  out << to_json(true).dump(2) << "\n";
  if(!out) {
    err = "write to " + path.string() + " failed";
    return false;
  }
  return true;
}

bool SettingsManager::load() {
  std::vector<std::string> warnings;
  std::string err;
  const auto path = settings_path();
  const bool ok = load_from_file(path, warnings, err);
  for(const auto& warning : warnings) print_err(nullptr, "{}: {}", path.string(), warning);
  if(!ok) print_err(nullptr, "{}", err);
  return ok;
}

bool SettingsManager::save() const {
  std::string err;
  if(save_to_file(settings_path(), err)) return true;
  print_err(nullptr, "{}", err);
  return false;
}

nlohmann::json SettingsManager::to_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& def : definitions_) {
    if(persistent_only && !def.persistent) continue;
    doc[def.key] = values_.at(def.key);
  }
  return doc;
}
