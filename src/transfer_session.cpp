#include "transfer_session.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

#include "completion_oracle.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "run_log.hpp"
#include "settings_manager.hpp"

namespace {

constexpr std::size_t kPreviewRows = 5;

} // namespace

const char* to_string(SessionState state) {
  switch(state) {
    case SessionState::NotStarted:   return "NotStarted";
    case SessionState::Launching:    return "Launching";
    case SessionState::Running:      return "Running";
    case SessionState::Exited:       return "Exited";
    case SessionState::Verifying:    return "Verifying";
    case SessionState::Done:         return "Done";
    case SessionState::LaunchFailed: return "LaunchFailed";
  }
  return "Unknown";
}

const char* to_string(RunOutcome outcome) {
  switch(outcome) {
    case RunOutcome::Success:            return "success";
    case RunOutcome::TransferFailed:     return "transfer failed";
    case RunOutcome::VerificationFailed: return "verification failed";
  }
  return "unknown";
}

SessionOptions SessionOptions::from_settings(const SettingsManager& settings) {
  SessionOptions options;
  options.manifest = settings.get<std::string>("manifest");
  options.out_dir = settings.get<std::string>("out_dir");
  options.log_dir = settings.get<std::string>("log_dir");
  options.threads = settings.get<int>("threads");
  options.client = settings.get<std::string>("client");
  options.token_file = settings.get<std::string>("token_file");
  options.poll_interval = std::chrono::seconds(std::max(1, settings.get<int>("progress_every")));
  options.verify_after = settings.get<bool>("verify_after");
  options.fail_on_verify = settings.get<bool>("fail_on_verify");
  return options;
}

TransferSession::TransferSession(SessionOptions options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("bulkfetch")) {
  if(options_.log_dir.empty()) {
    options_.log_dir = "logs";
  }
  transitions_.push_back(state_);
}

void TransferSession::transition(SessionState next) {
  logger_->debug("session: {} -> {}", to_string(state_), to_string(next));
  state_ = next;
  transitions_.push_back(next);
}

void TransferSession::validate_options(bool require_out_dir) const {
  if(options_.manifest.empty()) {
    throw ConfigError("No manifest given (--manifest)");
  }
  if(require_out_dir && options_.out_dir.empty()) {
    throw ConfigError("No output directory given (--out_dir)");
  }
  if(options_.threads < 1) {
    throw ConfigError("threads must be at least 1 (got " + std::to_string(options_.threads) + ")");
  }
  if(options_.client.empty()) {
    throw ConfigError("No transfer client configured (--client)");
  }
}

TransferCommand TransferSession::command() const {
  TransferCommand cmd;
  cmd.client = options_.client;
  cmd.manifest = options_.manifest;
  cmd.out_dir = options_.out_dir;
  cmd.threads = options_.threads;
  cmd.token_file = options_.token_file;
  return cmd;
}

RunResult TransferSession::run() {
  validate_options(true);
  prepare_directories(options_.out_dir, options_.log_dir);
  auto manifest = load_manifest(options_.manifest, logger_.get());

  const auto cmd = command();
  RunResult result;
  result.total = manifest.size();
  result.log_path = timestamped_path(options_.log_dir, "transfer", ".log");

  RunLog run_log(result.log_path);
  std::vector<std::pair<std::string, std::string>> parameters = {
    {"MANIFEST", options_.manifest.string()},
    {"OUT_DIR", options_.out_dir.string()},
    {"THREADS", std::to_string(options_.threads)},
  };
  if(!options_.token_file.empty()) {
    parameters.emplace_back("TOKEN_FILE", options_.token_file.string());
  }
  run_log.write_header(cmd.to_string(), parameters);

  ProgressMonitor monitor(manifest.rows, options_.out_dir, options_.poll_interval, status_);
  result.initial_completed = monitor.initial_completed();
  logger_->info("Launching {} for {} files ({} already present), log: {}",
                options_.client, result.total, result.initial_completed, result.log_path.string());

  transition(SessionState::Launching);
  std::optional<ChildProcess> child;
  try {
    child.emplace(ChildProcess::spawn(cmd.argv()));
  } catch(const LaunchError& e) {
    run_log.append_tagged("ERROR", e.what());
    transition(SessionState::LaunchFailed);
    logger_->error("{}", e.what());
    throw;
  }
  transition(SessionState::Running);

  LastLineCell last_line;
  OutputDrain drain(child->release_output(), run_log, last_line);
  drain.start();
  const int code = monitor.watch(*child, drain, last_line);
  drain.stop();
  transition(SessionState::Exited);

  result.child_exit_code = code;
  result.final_completed = monitor.last_completed();

  if(code != 0) {
    run_log.append_blank();
    run_log.append_tagged("ERROR", fmt::format("{} exited with code {}", options_.client, code));
    logger_->error("{} exited with code {}; log: {}", options_.client, code, result.log_path.string());
    result.outcome = RunOutcome::TransferFailed;
    result.exit_code = code;
    transition(SessionState::Done);
    return result;
  }

  if(options_.verify_after) {
    transition(SessionState::Verifying);
    try {
      result = apply_verification(std::move(result), manifest, &run_log);
    } catch(const IoError& e) {
      run_log.append_tagged("ERROR", e.what());
      throw;
    }
  }
  transition(SessionState::Done);
  logger_->info("Transfer finished: {}/{} present ({})",
                result.final_completed, result.total, to_string(result.outcome));
  return result;
}

RunResult TransferSession::apply_verification(RunResult result, const Manifest& manifest, RunLog* run_log) {
  auto report = timestamped_path(options_.log_dir, "verify", ".csv");
  auto summary = verify(manifest.rows, options_.out_dir, report, logger_.get());

  const auto counts = fmt::format("OK={} MISSING={} EMPTY={}", summary.ok, summary.missing, summary.empty);
  if(run_log) {
    run_log->append_blank();
    run_log->append_tagged("VERIFY", counts);
    run_log->append_tagged("VERIFY", "Report: " + report.string());
  }
  logger_->print("[VERIFY] {}", counts);
  logger_->print("[VERIFY] Report: {}", report.string());

  if(!summary.clean() && options_.fail_on_verify) {
    result.outcome = RunOutcome::VerificationFailed;
    result.exit_code = kExitVerifyFailed;
  }
  result.verification = std::move(summary);
  return result;
}

RunResult TransferSession::audit() {
  validate_options(true);
  prepare_directories(std::filesystem::path(), options_.log_dir);
  auto manifest = load_manifest(options_.manifest, logger_.get());

  RunResult result;
  result.total = manifest.size();
  result.initial_completed = count_completed(manifest.rows, options_.out_dir);
  result.final_completed = result.initial_completed;
  result = apply_verification(std::move(result), manifest, nullptr);
  return result;
}

void TransferSession::preview() {
  validate_options(true);
  auto manifest = load_manifest(options_.manifest, logger_.get());
  const auto present = count_completed(manifest.rows, options_.out_dir);

  logger_->print("[DRY RUN] transfer preview");
  logger_->print("  Manifest: {}", options_.manifest.string());
  logger_->print("  Files to download: {}", manifest.size());
  logger_->print("  Already present: {}", present);
  logger_->print("  Output directory: {}", options_.out_dir.string());
  logger_->print("  Log directory: {}", options_.log_dir.string());
  logger_->print("  Connections (-n): {}", options_.threads);
  logger_->print("  Client: {}", options_.client);
  logger_->print("  verify_after: {}", options_.verify_after);
  logger_->print("  fail_on_verify: {}", options_.fail_on_verify);
  if(!options_.token_file.empty()) {
    logger_->print("  token_file: {}", options_.token_file.string());
  }
  logger_->print("  Command: {}", command().to_string());
  logger_->print("");
  logger_->print("  First {} files:", std::min(kPreviewRows, manifest.size()));
  for(std::size_t i = 0; i < manifest.size() && i < kPreviewRows; ++i) {
    const auto& row = manifest.rows[i];
    logger_->print("    {}\t{}", row.id, row.filename);
  }
  logger_->print("");
  logger_->print("[DRY RUN] No files were downloaded.");
}
