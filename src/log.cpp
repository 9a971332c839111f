#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <atomic>
#include <mutex>
#include <vector>

namespace {

// Four console streams: decorated stdout/stderr for diagnostics, and plain
// stdout/stderr for user-facing output such as the dry-run plan.
enum ConsoleStream { kOut = 0, kErr, kPlainOut, kPlainErr, kStreamCount };

std::array<std::shared_ptr<spdlog::logger>, kStreamCount> g_console;
std::once_flag g_console_once;
std::atomic<bool> g_passthrough{true};

constexpr const char* kDecoratedPattern = "[%Y-%m-%d %H:%M:%S] [%^%l%$] %v";

template<typename Sink>
std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    const char* pattern,
                                                    spdlog::level::level_enum flush_level) {
  auto sink = std::make_shared<Sink>();
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  spdlog::register_logger(logger);
  return logger;
}

void build_console() {
  using spdlog::sinks::stderr_color_sink_mt;
  using spdlog::sinks::stdout_color_sink_mt;
  g_console[kOut] = make_console_logger<stdout_color_sink_mt>("bulkfetch.out", kDecoratedPattern, spdlog::level::info);
  g_console[kErr] = make_console_logger<stderr_color_sink_mt>("bulkfetch.err", kDecoratedPattern, spdlog::level::warn);
  g_console[kPlainOut] = make_console_logger<stdout_color_sink_mt>("bulkfetch.print", "%v", spdlog::level::info);
  g_console[kPlainErr] = make_console_logger<stderr_color_sink_mt>("bulkfetch.print_err", "%v", spdlog::level::err);
}

void ensure_console() {
  std::call_once(g_console_once, build_console);
}

ConsoleStream stream_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print:    return kPlainOut;
    case LogChannel::PrintErr: return kPlainErr;
    case LogChannel::Warn:
    case LogChannel::Error:    return kErr;
    default:                   return kOut;
  }
}

bool is_plain(LogChannel channel) {
  return channel == LogChannel::Print || channel == LogChannel::PrintErr;
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info:     return "info";
    case LogChannel::Warn:     return "warn";
    case LogChannel::Error:    return "error";
    case LogChannel::Debug:    return "debug";
    case LogChannel::Print:    return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn:     return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug:    return spdlog::level::debug;
    default:                   return spdlog::level::info;
  }
}

void init(bool verbose) {
  ensure_console();
  const auto diagnostics = verbose ? spdlog::level::debug : spdlog::level::info;
  for(auto& logger : g_console) {
    logger->set_level(spdlog::level::info);
  }
  g_console[kOut]->set_level(diagnostics);
  spdlog::set_default_logger(g_console[kOut]);
  spdlog::set_level(diagnostics);
}

void set_log_passthrough(bool enabled) {
  g_passthrough = enabled;
}

bool log_passthrough() {
  return g_passthrough;
}

Logger::Logger(std::string name)
  : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  const LogListenerHandle handle = next_listener_id_.fetch_add(1);
  std::lock_guard lock(listener_mutex_);
  listeners_[handle] = ListenerBinding{user_data, std::move(listener)};
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::emit(LogChannel channel, const std::string& message) {
  const std::string label = name_.empty()
    ? std::string(channel_name(channel))
    : name_ + ":" + channel_name(channel);
  if(!dispatch(label, channel_level(channel), message)) {
    detail::emit_to_default(channel, label, message);
  }
}

// Callbacks run outside the lock so a listener may add or remove listeners.
bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> bindings;
  {
    std::lock_guard lock(listener_mutex_);
    if(listeners_.empty()) return false;
    for(const auto& [handle, binding] : listeners_) {
      (void)handle;
      bindings.push_back(binding);
    }
  }
  bool claimed = false;
  for(const auto& binding : bindings) {
    claimed = binding.callback(binding.user_data, channel, level, message) || claimed;
  }
  return claimed;
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& channel_label,
                     const std::string& message) {
  if(!log_passthrough()) return;
  ensure_console();

  auto& target = g_console[stream_for(channel)];
  const auto level = channel_level(channel);
  if(is_plain(channel) || channel_label == channel_name(channel)) {
    target->log(level, message);
  } else {
    target->log(level, fmt::format("[{}] {}", channel_label, message));
  }
}

} // namespace detail
