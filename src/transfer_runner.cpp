#include "transfer_runner.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>
#include <utility>

#include "errors.hpp"

namespace {

void close_fd(int& fd) {
  if(fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::string quote_for_display(const std::string& arg) {
  if(!arg.empty() && arg.find_first_of(" \t\"'\\$") == std::string::npos) return arg;
  std::string quoted = "'";
  for(char ch : arg) {
    if(ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(ch);
    }
  }
  quoted += "'";
  return quoted;
}

} // namespace

std::vector<std::string> TransferCommand::argv() const {
  std::vector<std::string> args = {
    client,
    "download",
    "-m", manifest.string(),
    "-d", out_dir.string(),
    "-n", std::to_string(threads),
  };
  if(!token_file.empty()) {
    args.push_back("-t");
    args.push_back(token_file.string());
  }
  return args;
}

std::string TransferCommand::to_string() const {
  std::ostringstream out;
  auto args = argv();
  for(std::size_t i = 0; i < args.size(); ++i) {
    if(i > 0) out << ' ';
    out << quote_for_display(args[i]);
  }
  return out.str();
}

void prepare_directories(const std::filesystem::path& out_dir,
                         const std::filesystem::path& log_dir) {
  for(const auto& dir : {out_dir, log_dir}) {
    if(dir.empty()) continue;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if(ec) {
      throw IoError("Unable to create directory " + dir.string() + ": " + ec.message());
    }
  }
}

ChildProcess ChildProcess::spawn(const std::vector<std::string>& argv) {
  if(argv.empty() || argv.front().empty()) {
    throw LaunchError("No transfer client executable configured");
  }

  // Everything the child needs is prepared before fork.
  std::vector<std::string> storage(argv);
  std::vector<char*> c_argv;
  c_argv.reserve(storage.size() + 1);
  for(auto& arg : storage) c_argv.push_back(arg.data());
  c_argv.push_back(nullptr);

  int output_pipe[2] = {-1, -1};
  if(::pipe2(output_pipe, O_CLOEXEC) != 0) {
    throw LaunchError(std::string("Unable to create output pipe: ") + std::strerror(errno));
  }
  // Carries errno back from a failed exec; closes itself on a successful one.
  int status_pipe[2] = {-1, -1};
  if(::pipe2(status_pipe, O_CLOEXEC) != 0) {
    int err = errno;
    close_fd(output_pipe[0]);
    close_fd(output_pipe[1]);
    throw LaunchError(std::string("Unable to create status pipe: ") + std::strerror(err));
  }

  pid_t pid = ::fork();
  if(pid < 0) {
    int err = errno;
    close_fd(output_pipe[0]);
    close_fd(output_pipe[1]);
    close_fd(status_pipe[0]);
    close_fd(status_pipe[1]);
    throw LaunchError(std::string("fork failed: ") + std::strerror(err));
  }

  if(pid == 0) {
    ::close(output_pipe[0]);
    ::close(status_pipe[0]);
    if(::dup2(output_pipe[1], STDOUT_FILENO) >= 0 &&
       ::dup2(output_pipe[1], STDERR_FILENO) >= 0) {
      ::execvp(c_argv[0], c_argv.data());
    }
    int err = errno;
    ssize_t written = ::write(status_pipe[1], &err, sizeof(err));
    (void)written;
    ::_exit(127);
  }

  close_fd(output_pipe[1]);
  close_fd(status_pipe[1]);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while(n < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if(n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    while(::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    close_fd(output_pipe[0]);
    throw LaunchError("Unable to launch '" + argv.front() + "': " + std::strerror(child_errno));
  }

  return ChildProcess(pid, output_pipe[0]);
}

ChildProcess::ChildProcess(pid_t pid, int output_fd)
  : pid_(pid), output_fd_(output_fd) {}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
  : pid_(std::exchange(other.pid_, -1)),
    output_fd_(std::exchange(other.output_fd_, -1)),
    exit_code_(std::exchange(other.exit_code_, std::nullopt)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
  if(this != &other) {
    terminate();
    close_fd(output_fd_);
    pid_ = std::exchange(other.pid_, -1);
    output_fd_ = std::exchange(other.output_fd_, -1);
    exit_code_ = std::exchange(other.exit_code_, std::nullopt);
  }
  return *this;
}

ChildProcess::~ChildProcess() {
  terminate();
  close_fd(output_fd_);
}

int ChildProcess::release_output() {
  return std::exchange(output_fd_, -1);
}

int ChildProcess::decode_status(int status) {
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

std::optional<int> ChildProcess::try_wait() {
  if(exit_code_ || pid_ <= 0) return exit_code_;
  int status = 0;
  pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if(r == 0) return std::nullopt;
  if(r < 0) {
    if(errno == EINTR) return std::nullopt;
    throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  exit_code_ = decode_status(status);
  return exit_code_;
}

int ChildProcess::wait() {
  if(exit_code_) return *exit_code_;
  if(pid_ <= 0) throw std::logic_error("wait() on a child that was never spawned");
  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid_, &status, 0);
  } while(r < 0 && errno == EINTR);
  if(r < 0) {
    throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  exit_code_ = decode_status(status);
  return *exit_code_;
}

void ChildProcess::terminate() {
  if(pid_ <= 0 || exit_code_) return;
  ::kill(pid_, SIGTERM);
  int status = 0;
  while(::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
  exit_code_ = decode_status(status);
}
