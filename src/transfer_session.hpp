#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "manifest.hpp"
#include "progress_monitor.hpp"
#include "transfer_runner.hpp"
#include "verifier.hpp"

class Logger;
class RunLog;
class SettingsManager;

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitConfigError = 1;
inline constexpr int kExitVerifyFailed = 2;
inline constexpr int kExitLaunchFailed = 127;

enum class SessionState {
  NotStarted,
  Launching,
  Running,
  Exited,
  Verifying,
  Done,
  LaunchFailed
};

const char* to_string(SessionState state);

enum class RunOutcome {
  Success,
  TransferFailed,     // client ran and exited non-zero
  VerificationFailed  // client exited 0 but files are missing/empty and the gate is on
};

const char* to_string(RunOutcome outcome);

struct RunResult {
  RunOutcome outcome = RunOutcome::Success;
  int exit_code = kExitSuccess;
  std::optional<int> child_exit_code;
  std::size_t total = 0;
  std::size_t initial_completed = 0;
  std::size_t final_completed = 0;
  std::optional<VerifySummary> verification;
  std::filesystem::path log_path;

  bool ok() const { return outcome == RunOutcome::Success; }
};

struct SessionOptions {
  std::filesystem::path manifest;
  std::filesystem::path out_dir;
  std::filesystem::path log_dir = "logs";
  int threads = 8;
  std::string client = "gdc-client";
  std::filesystem::path token_file;
  std::chrono::milliseconds poll_interval = ProgressMonitor::kDefaultInterval;
  bool verify_after = false;
  bool fail_on_verify = false;

  static SessionOptions from_settings(const SettingsManager& settings);
};

// One invocation of the transfer client against one manifest:
//   NotStarted -> Launching -> Running -> Exited -> [Verifying ->] Done
// with LaunchFailed as the terminal state when the client cannot be started.
// Nothing is spawned until the manifest and parameters have been validated.
class TransferSession {
public:
  explicit TransferSession(SessionOptions options, std::shared_ptr<Logger> logger = nullptr);

  void set_status_callback(StatusCallback status) { status_ = std::move(status); }

  // Throws ConfigError before spawning, LaunchError if the client never ran.
  RunResult run();

  // Read-only verification of what is on disk right now.
  RunResult audit();

  // Prints the plan; launches nothing and writes nothing.
  void preview();

  SessionState state() const { return state_; }
  const std::vector<SessionState>& transitions() const { return transitions_; }
  const SessionOptions& options() const { return options_; }

  TransferCommand command() const;

private:
  void transition(SessionState next);
  void validate_options(bool require_out_dir) const;
  RunResult apply_verification(RunResult result, const Manifest& manifest, RunLog* run_log);

  SessionOptions options_;
  std::shared_ptr<Logger> logger_;
  StatusCallback status_;
  SessionState state_ = SessionState::NotStarted;
  std::vector<SessionState> transitions_;
};
