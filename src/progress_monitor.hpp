#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "manifest.hpp"

class ChildProcess;
class RunLog;

// Most recent line seen from the client, shared between the output drain and
// the status loop. Last write wins; intermediate lines may never be displayed.
class LastLineCell {
public:
  void set(std::string line);
  std::string get() const;

private:
  mutable std::mutex mutex_;
  std::string line_;
};

// Splits a byte stream into lines the way a text-mode reader does: "\n", "\r"
// and "\r\n" each end one line, so carriage-return progress bars yield one line
// per redraw. A line that never ends is cut at kMaxLineLength.
class LineSplitter {
public:
  using LineHandler = std::function<void(const std::string&)>;

  static constexpr std::size_t kMaxLineLength = 64 * 1024;

  void feed(const char* data, std::size_t size, const LineHandler& on_line);
  // Emits an unterminated trailing fragment, if any.
  void finish(const LineHandler& on_line);

private:
  std::string pending_;
  bool after_cr_ = false;
};

// Background reader for the client's combined output. Each line goes to the run
// log first, then into the LastLineCell, so the log never loses a line even
// though the live display may.
class OutputDrain {
public:
  OutputDrain(int output_fd, RunLog& log, LastLineCell& last_line);
  ~OutputDrain();

  OutputDrain(const OutputDrain&) = delete;
  OutputDrain& operator=(const OutputDrain&) = delete;

  void start();

  // True once the stream hit EOF (or failed). Waits up to timeout for that.
  bool wait_closed(std::chrono::milliseconds timeout);
  bool closed() const;

  // Waits up to grace for EOF, then forcibly closes the descriptor and joins.
  void stop(std::chrono::milliseconds grace = std::chrono::seconds(5));

  std::size_t line_count() const { return line_count_.load(); }

private:
  void do_read();
  void handle_line(const std::string& line);
  void mark_closed();

  asio::io_context io_;
  asio::posix::stream_descriptor stream_;
  std::array<char, 4096> chunk_{};
  LineSplitter splitter_;
  std::thread thread_;
  RunLog& log_;
  LastLineCell& last_line_;
  mutable std::mutex state_mutex_;
  std::condition_variable closed_cv_;
  bool closed_ = false;
  std::atomic<std::size_t> line_count_{0};
};

struct ProgressSnapshot {
  std::size_t done = 0;
  std::size_t total = 0;
  std::size_t initial_done = 0;
  std::chrono::seconds elapsed{0};
  std::string last_line;
};

inline constexpr std::size_t kStatusExcerptLength = 120;

std::string format_elapsed(std::chrono::seconds elapsed);
bool is_interesting(const std::string& line);
std::string trim_copy(const std::string& value);

// Longest prefix of at most max_bytes that does not end inside a UTF-8 sequence.
std::string utf8_prefix(const std::string& text, std::size_t max_bytes);

// Progress: 3/10 ( 30.0%) | elapsed 00:01:05 | resumed_from 2 | last: ...
std::string format_progress_line(const ProgressSnapshot& snapshot);

// Receives each rendered status line; final is set on the last one of a run.
using StatusCallback = std::function<void(const std::string& line, bool final)>;

// Overwrites one terminal line in place with carriage returns.
StatusCallback make_console_status();

class ProgressMonitor {
public:
  static constexpr std::chrono::milliseconds kMinInterval{1000};
  static constexpr std::chrono::milliseconds kDefaultInterval{10000};

  // Counts what is already on disk now; that is the resumed_from figure.
  ProgressMonitor(const std::vector<ManifestRow>& rows,
                  std::filesystem::path output_root,
                  std::chrono::milliseconds interval = kDefaultInterval,
                  StatusCallback status = {});

  std::size_t initial_completed() const { return initial_completed_; }
  std::size_t last_completed() const { return last_completed_; }
  std::chrono::milliseconds interval() const { return interval_; }

  // Renders status on every tick until the child exits, then renders once more
  // and returns its exit code.
  int watch(ChildProcess& child, OutputDrain& drain, const LastLineCell& last_line);

private:
  ProgressSnapshot sample(std::chrono::steady_clock::time_point start,
                          const LastLineCell& last_line);

  const std::vector<ManifestRow>& rows_;
  std::filesystem::path output_root_;
  std::chrono::milliseconds interval_;
  StatusCallback status_;
  std::size_t initial_completed_ = 0;
  std::size_t last_completed_ = 0;
};
