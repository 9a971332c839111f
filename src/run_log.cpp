#include "run_log.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <ctime>

#include "errors.hpp"

RunLog::RunLog(std::filesystem::path path)
  : path_(std::move(path)) {
  try {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path_.string(), true);
    file_sink->set_pattern("%v");
    sink_ = std::make_shared<spdlog::logger>("run_log", std::move(file_sink));
    sink_->set_level(spdlog::level::trace);
    sink_->flush_on(spdlog::level::trace);
  } catch(const spdlog::spdlog_ex& e) {
    throw IoError("Unable to open run log " + path_.string() + ": " + e.what());
  }
}

RunLog::~RunLog() {
  if(sink_) sink_->flush();
}

void RunLog::write_header(const std::string& command,
                          const std::vector<std::pair<std::string, std::string>>& parameters) {
  sink_->info("[CMD] {}", command);
  for(const auto& entry : parameters) {
    sink_->info("[{}] {}", entry.first, entry.second);
  }
  sink_->info("");
}

void RunLog::append_output(const std::string& line) {
  sink_->log(spdlog::level::info, spdlog::string_view_t(line.data(), line.size()));
}

void RunLog::append_tagged(const std::string& tag, const std::string& message) {
  sink_->info("[{}] {}", tag, message);
}

void RunLog::append_blank() {
  sink_->info("");
}

void RunLog::flush() {
  sink_->flush();
}

std::filesystem::path timestamped_path(const std::filesystem::path& dir,
                                       const std::string& prefix,
                                       const std::string& extension) {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
  return dir / (prefix + "_" + stamp + extension);
}
