#include "progress_monitor.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iostream>
#include <memory>

#include "completion_oracle.hpp"
#include "run_log.hpp"
#include "transfer_runner.hpp"

namespace {

constexpr std::array<const char*, 7> kInterestingKeywords = {
  "transfer", "download", "error", "retry", "complete", "saved", "skipping"
};

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

} // namespace

void LineSplitter::feed(const char* data, std::size_t size, const LineHandler& on_line) {
  for(std::size_t i = 0; i < size; ++i) {
    const char ch = data[i];
    if(after_cr_) {
      after_cr_ = false;
      if(ch == '\n') continue;
    }
    if(ch == '\n' || ch == '\r') {
      on_line(pending_);
      pending_.clear();
      after_cr_ = (ch == '\r');
      continue;
    }
    pending_.push_back(ch);
    if(pending_.size() >= kMaxLineLength) {
      on_line(pending_);
      pending_.clear();
    }
  }
}

void LineSplitter::finish(const LineHandler& on_line) {
  if(!pending_.empty()) {
    on_line(pending_);
    pending_.clear();
  }
  after_cr_ = false;
}

void LastLineCell::set(std::string line) {
  std::lock_guard<std::mutex> lock(mutex_);
  line_ = std::move(line);
}

std::string LastLineCell::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return line_;
}

OutputDrain::OutputDrain(int output_fd, RunLog& log, LastLineCell& last_line)
  : stream_(io_, output_fd), log_(log), last_line_(last_line) {}

OutputDrain::~OutputDrain() {
  stop(std::chrono::milliseconds(0));
}

void OutputDrain::start() {
  if(thread_.joinable()) return;
  do_read();
  thread_ = std::thread([this](){
    io_.run();
  });
}

void OutputDrain::do_read() {
  stream_.async_read_some(asio::buffer(chunk_),
    [this](std::error_code ec, std::size_t bytes_transferred){
      auto on_line = [this](const std::string& line){ handle_line(line); };
      if(!ec) {
        splitter_.feed(chunk_.data(), bytes_transferred, on_line);
        do_read();
        return;
      }
      // EOF or a closed descriptor: whatever is left is an unterminated last line.
      splitter_.finish(on_line);
      mark_closed();
    });
}

void OutputDrain::handle_line(const std::string& line) {
  log_.append_output(line);
  last_line_.set(trim_copy(line));
  ++line_count_;
}

void OutputDrain::mark_closed() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    closed_ = true;
  }
  closed_cv_.notify_all();
}

bool OutputDrain::closed() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return closed_;
}

bool OutputDrain::wait_closed(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return closed_cv_.wait_for(lock, timeout, [this]{ return closed_; });
}

void OutputDrain::stop(std::chrono::milliseconds grace) {
  if(!thread_.joinable()) return;
  if(!wait_closed(grace)) {
    // Something (usually a grandchild) still holds the write end open.
    asio::post(io_, [this](){
      std::error_code ec;
      stream_.close(ec);
    });
  }
  thread_.join();
}

std::string trim_copy(const std::string& value) {
  auto begin = std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); });
  auto end = std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base();
  if(begin >= end) return std::string();
  return std::string(begin, end);
}

std::string utf8_prefix(const std::string& text, std::size_t max_bytes) {
  if(text.size() <= max_bytes) return text;
  std::size_t cut = max_bytes;
  while(cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut);
}

std::string format_elapsed(std::chrono::seconds elapsed) {
  long long total = std::max<long long>(0, elapsed.count());
  return fmt::format("{:02}:{:02}:{:02}", total / 3600, (total % 3600) / 60, total % 60);
}

bool is_interesting(const std::string& line) {
  if(line.empty()) return false;
  auto lowered = to_lower(line);
  return std::any_of(kInterestingKeywords.begin(), kInterestingKeywords.end(),
    [&](const char* keyword){ return lowered.find(keyword) != std::string::npos; });
}

std::string format_progress_line(const ProgressSnapshot& snapshot) {
  double pct = snapshot.total == 0
    ? 0.0
    : static_cast<double>(snapshot.done) * 100.0 / static_cast<double>(snapshot.total);
  auto line = fmt::format("Progress: {}/{} ({:5.1f}%) | elapsed {} | resumed_from {}",
                          snapshot.done,
                          snapshot.total,
                          pct,
                          format_elapsed(snapshot.elapsed),
                          snapshot.initial_done);
  if(is_interesting(snapshot.last_line)) {
    line += " | last: " + utf8_prefix(snapshot.last_line, kStatusExcerptLength);
  }
  return line;
}

StatusCallback make_console_status() {
  auto width = std::make_shared<std::size_t>(0);
  return [width](const std::string& line, bool final){
    std::cout << "\r" << line;
    if(line.size() < *width) {
      std::cout << std::string(*width - line.size(), ' ');
    } else {
      *width = line.size();
    }
    if(final) {
      std::cout << "\n";
      *width = 0;
    }
    std::cout.flush();
  };
}

ProgressMonitor::ProgressMonitor(const std::vector<ManifestRow>& rows,
                                 std::filesystem::path output_root,
                                 std::chrono::milliseconds interval,
                                 StatusCallback status)
  : rows_(rows),
    output_root_(std::move(output_root)),
    interval_(std::max(interval, kMinInterval)),
    status_(status ? std::move(status) : make_console_status()) {
  initial_completed_ = count_completed(rows_, output_root_);
  last_completed_ = initial_completed_;
}

ProgressSnapshot ProgressMonitor::sample(std::chrono::steady_clock::time_point start,
                                         const LastLineCell& last_line) {
  ProgressSnapshot snapshot;
  snapshot.done = count_completed(rows_, output_root_);
  snapshot.total = rows_.size();
  snapshot.initial_done = initial_completed_;
  snapshot.elapsed = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::steady_clock::now() - start);
  snapshot.last_line = last_line.get();
  last_completed_ = snapshot.done;
  return snapshot;
}

int ProgressMonitor::watch(ChildProcess& child, OutputDrain& drain, const LastLineCell& last_line) {
  const auto start = std::chrono::steady_clock::now();
  bool output_open = true;
  for(;;) {
    auto exit_code = child.try_wait();
    auto snapshot = sample(start, last_line);
    status_(format_progress_line(snapshot), exit_code.has_value());
    if(exit_code) return *exit_code;

    if(output_open) {
      // Wake early once when the client closes its output; it is usually exiting.
      if(drain.wait_closed(interval_)) output_open = false;
    } else {
      std::this_thread::sleep_for(interval_);
    }
  }
}
