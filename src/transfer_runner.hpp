#pragma once

#include <sys/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Command line for the external transfer client. The client owns the network
// side entirely; we only translate our parameters into its native flags:
//   <client> download -m <manifest> -d <out_dir> -n <threads> [-t <token_file>]
struct TransferCommand {
  std::string client = "gdc-client";
  std::filesystem::path manifest;
  std::filesystem::path out_dir;
  int threads = 8;
  std::filesystem::path token_file;

  std::vector<std::string> argv() const;
  std::string to_string() const;
};

// Idempotent; throws IoError if either directory cannot be created.
void prepare_directories(const std::filesystem::path& out_dir,
                         const std::filesystem::path& log_dir);

// One spawned child whose stdout and stderr share a single pipe, so progress
// and error text keep their relative order.
class ChildProcess {
public:
  // Throws LaunchError if the executable cannot be started at all.
  static ChildProcess spawn(const std::vector<std::string>& argv);

  ChildProcess(ChildProcess&& other) noexcept;
  ChildProcess& operator=(ChildProcess&& other) noexcept;
  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;
  ~ChildProcess();

  pid_t pid() const { return pid_; }

  // Read end of the combined output pipe. Ownership moves to the caller.
  int release_output();

  // Exit code once the child has terminated, nullopt while it still runs.
  std::optional<int> try_wait();
  int wait();

  bool exited() const { return exit_code_.has_value(); }

private:
  ChildProcess(pid_t pid, int output_fd);

  static int decode_status(int status);
  void terminate();

  pid_t pid_ = -1;
  int output_fd_ = -1;
  std::optional<int> exit_code_;
};
