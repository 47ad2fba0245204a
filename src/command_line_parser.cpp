#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) args.assign(argv + 1, argv + argc);
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;

  auto store = [&](const std::string& key, const std::string& shown, const std::string& value){
    std::string error;
    if(!settings.set_from_string(key, value, error)) {
      throw std::invalid_argument("Invalid value for '" + shown + "': " + error);
    }
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(is_option_token(token)) {
      bool long_form = token.rfind("--", 0) == 0;
      std::string name = token.substr(long_form ? 2 : 1);
      std::optional<std::string> inline_value;
      auto eq = name.find('=');
      if(eq != std::string::npos) {
        inline_value = name.substr(eq + 1);
        name = name.substr(0, eq);
      }
      auto resolved = settings.resolve_key(name);
      if(!resolved) throw std::invalid_argument("Unknown option " + token);

      if(inline_value) {
        store(*resolved, name, *inline_value);
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
          store(*resolved, name, args[++i]);
        } else {
          store(*resolved, name, "true");
        }
      } else {
        if(i + 1 >= args.size()) throw std::invalid_argument("Missing value for option '" + name + "'");
        store(*resolved, name, args[++i]);
      }
      continue;
    }

    if(positional_index >= positional_specs_.size()) {
      throw std::invalid_argument("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    store(spec.key, spec.key, token);
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - share project bundles with peers on the local network", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) cmd += " [" + pos.key + "]";
  print_out(nullptr, "  {} [options]", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  SettingsManager probe(settings_spec_);
  for(const auto& spec : probe.specs()) {
    std::string argument_hint = (spec.type == "bool") ? "[true|false]" : "<" + spec.type + ">";
    std::ostringstream aliases;
    if(!spec.aliases.empty()) {
      aliases << " (alias: ";
      for(std::size_t i = 0; i < spec.aliases.size(); ++i) {
        if(i > 0) aliases << ", ";
        aliases << "-" << spec.aliases[i];
      }
      aliases << ")";
    }
    print_out(nullptr, "  --{:<17} {:<12} {}{} (default: {})",
              spec.key,
              argument_hint,
              spec.description,
              aliases.str(),
              SettingsManager::default_to_string(spec));
  }
  print_out(nullptr, "");
}
