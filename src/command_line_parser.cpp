#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>

#include "errors.hpp"
#include "log.hpp"

namespace {

std::string describe_default(const nlohmann::json& entry) {
  const auto& value = entry.at("default");
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  if(value.is_string()) {
    auto text = value.get<std::string>();
    return text.empty() ? "none" : text;
  }
  return value.dump();
}

std::string describe_aliases(const nlohmann::json& entry) {
  if(!entry.contains("aliases") || entry.at("aliases").empty()) return std::string();
  std::string text = " (alias:";
  for(const auto& alias : entry.at("aliases")) {
    text += " -" + alias.get<std::string>();
  }
  return text + ")";
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  SettingsManager known(settings_spec_);
  std::vector<ArgvSpec> slots;
  slots.reserve(spec.size());
  for(const auto& entry : spec) {
    ArgvSpec slot;
    slot.index = entry.at("index").get<std::size_t>();
    slot.key = entry.at("key").get<std::string>();
    if(!known.resolve_key(slot.key)) {
      throw std::logic_error("Positional slot " + std::to_string(slot.index) +
                             " names unknown setting '" + slot.key + "'");
    }
    slots.push_back(std::move(slot));
  }
  std::sort(slots.begin(), slots.end(),
            [](const ArgvSpec& lhs, const ArgvSpec& rhs){ return lhs.index < rhs.index; });
  return slots;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.size() < 2 || candidate[0] != '-') return false;
  return candidate[1] == '-' || std::isalpha(static_cast<unsigned char>(candidate[1]));
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  for(int i = 1; argv && i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t next_slot = 0;
  std::size_t pos = 0;

  auto assign = [&](const std::string& key, const std::string& value, const std::string& shown_as){
    std::string error;
    if(!settings.set_from_string(key, value, error)) {
      throw ConfigError("Invalid value '" + value + "' for " + shown_as + ": " + error);
    }
  };

  while(pos < args.size()) {
    const std::string& arg = args[pos++];
    const bool long_form = arg.rfind("--", 0) == 0;
    const bool short_form = !long_form && arg.size() > 1 && arg[0] == '-';

    if(long_form || short_form) {
      std::string name = arg.substr(long_form ? 2 : 1);
      std::string inline_value;
      bool has_inline_value = false;
      if(long_form) {
        auto eq = name.find('=');
        if(eq != std::string::npos) {
          inline_value = name.substr(eq + 1);
          name.erase(eq);
          has_inline_value = true;
        }
      }

      auto key = settings.resolve_key(name);
      if(key) {
        if(has_inline_value) {
          assign(*key, inline_value, arg);
        } else if(settings.is_bool_setting(*key)) {
          // A bare bool flag means true; a following literal may override it.
          if(pos < args.size() && !is_option_token(args[pos]) &&
             SettingsManager::is_bool_literal(args[pos])) {
            assign(*key, args[pos++], arg);
          } else {
            assign(*key, "true", arg);
          }
        } else {
          if(pos >= args.size()) {
            throw ConfigError("Option " + arg + " requires a value");
          }
          assign(*key, args[pos++], arg);
        }
        continue;
      }
      if(long_form) {
        throw ConfigError("Unknown option " + arg);
      }
      // Unknown short token such as "-1": fall through and treat it as positional.
    }

    if(next_slot >= positional_specs_.size()) {
      throw ConfigError("Unexpected positional argument '" + arg + "'");
    }
    const auto& slot = positional_specs_[next_slot++];
    assign(slot.key, arg, slot.key);
  }
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_;
  for(const auto& slot : positional_specs_) {
    synopsis += " [" + slot.key + "]";
  }

  print_out(nullptr, "{} - run a manifest through the transfer client and verify the result", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Usage: {} [options]", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    const auto type = entry.at("type").get<std::string>();
    const std::string hint = type == "bool" ? "[true|false]" : "<" + type + ">";
    print_out(nullptr, "  --{:<15} {:<12} {}{} (default: {})",
              entry.at("key").get<std::string>(),
              hint,
              entry.value("description", ""),
              describe_aliases(entry),
              describe_default(entry));
  }
  print_out(nullptr, "");
  print_out(nullptr, "Exit codes: 0 success, 1 configuration error, 2 verification failed,");
  print_out(nullptr, "            127 client could not be launched, otherwise the client's own code.");
}
