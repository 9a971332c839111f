#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace spdlog { class logger; }

// Durable record of one invocation: a header block describing the launched
// command, the client's output verbatim, and an optional trailer. Every line is
// flushed as it is written so the file survives a hard kill of this process.
class RunLog {
public:
  explicit RunLog(std::filesystem::path path);
  ~RunLog();

  RunLog(const RunLog&) = delete;
  RunLog& operator=(const RunLog&) = delete;

  const std::filesystem::path& path() const { return path_; }

  void write_header(const std::string& command,
                    const std::vector<std::pair<std::string, std::string>>& parameters);
  void append_output(const std::string& line);
  void append_tagged(const std::string& tag, const std::string& message);
  void append_blank();
  void flush();

private:
  std::filesystem::path path_;
  std::shared_ptr<spdlog::logger> sink_;
};

// <log_dir>/<prefix>_<YYYYmmdd_HHMMSS><extension>
std::filesystem::path timestamped_path(const std::filesystem::path& dir,
                                       const std::string& prefix,
                                       const std::string& extension);
