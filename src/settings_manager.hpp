#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every knob bulkfetch understands. Persistent keys are written by --save and
// read back from .config/settings.json on the next start.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","manifest"},       {"aliases", {"m"}},                 {"type","string"}, {"default",""},           {"description","TSV manifest with columns id<TAB>filename"}, {"persistent", false}},
  {{"key","out_dir"},        {"aliases", {"d","o"}},             {"type","string"}, {"default",""},           {"description","Download directory (<out_dir>/<id>/<filename>)"}, {"persistent", true}},
  {{"key","log_dir"},        {"aliases", {"l"}},                 {"type","string"}, {"default","logs"},       {"description","Where run logs and verification reports are written"}, {"persistent", true}},
  {{"key","threads"},        {"aliases", {"n"}},                 {"type","int"},    {"default",8},            {"description","Connections for the transfer client (-n)"}, {"persistent", true}},
  {{"key","client"},         {"aliases", {"gdc_client"}},        {"type","string"}, {"default","gdc-client"}, {"description","Transfer client executable or full path"}, {"persistent", true}},
  {{"key","token_file"},     {"aliases", {"t"}},                 {"type","string"}, {"default",""},           {"description","Optional token file for controlled-access data"}, {"persistent", true}},
  {{"key","progress_every"}, {"aliases", {"p"}},                 {"type","int"},    {"default",10},           {"description","Seconds between progress updates (minimum 1)"}, {"persistent", true}},
  {{"key","verify_after"},   {"aliases", {"verify"}},            {"type","bool"},   {"default",false},        {"description","Verify missing/empty files after the transfer"}, {"persistent", true}},
  {{"key","fail_on_verify"}, {"aliases", {"strict"}},            {"type","bool"},   {"default",false},        {"description","Exit 2 when verification finds problems"}, {"persistent", true}},
  {{"key","verify_only"},    {"aliases", {"audit"}},             {"type","bool"},   {"default",false},        {"description","Only verify what is on disk, do not launch the client"}, {"persistent", false}},
  {{"key","dry_run"},        {"aliases", {"preview"}},           {"type","bool"},   {"default",false},        {"description","Print the plan without launching anything"}, {"persistent", false}},
  {{"key","verbose"},        {"aliases", {"v"}},                 {"type","bool"},   {"default",false},        {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},           {"aliases", {"h","?"}},             {"type","bool"},   {"default",false},        {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},           {"aliases", {"persist"}},           {"type","bool"},   {"default",false},        {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!values_.contains(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return values_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  std::string value_as_string(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json to_json(bool persistent_only = true) const;
  const nlohmann::json& specification() const { return specification_; }

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  const SettingSpec* find_spec(const std::string& token) const;
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_value(const SettingSpec& spec, const std::string& text, std::string& error) const;

  nlohmann::json specification_;
  std::vector<SettingSpec> specs_;
  nlohmann::json values_;
  std::filesystem::path settings_path_;
};
