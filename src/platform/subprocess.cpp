#include "fdup/platform/subprocess.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <utility>

#include "fdup/error.h"

namespace fdup::platform {

namespace {

std::string ErrnoText(int err) {
  return std::string(std::strerror(err));
}

struct Pipe {
  FileDescriptor read_end;
  FileDescriptor write_end;

  static Pipe Create() {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      const int err = errno;
      throw Error{ErrorDomain::IO, errors::io::kPipeFailed, "pipe failed: " + ErrnoText(err), err};
    }
    Pipe result;
    result.read_end.reset(fds[0]);
    result.write_end.reset(fds[1]);
    return result;
  }
};

bool WriteAll(int fd, const uint8_t* data, size_t size, int* err) {
  size_t written = 0;
  while (written < size) {
    ssize_t rc = ::write(fd, data + written, size - written);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      *err = errno;
      return false;
    }
    written += static_cast<size_t>(rc);
  }
  return true;
}

// Child side of Spawn(). Only async-signal-safe calls from here on.
[[noreturn]] void ExecChild(char* const* argv, int stdin_fd, int stdout_fd, int stderr_fd,
                            int report_fd) {
  if (stdin_fd >= 0 && ::dup2(stdin_fd, STDIN_FILENO) < 0) {
    int err = errno;
    (void)!::write(report_fd, &err, sizeof(err));
    ::_exit(127);
  }
  if (stdout_fd >= 0 && ::dup2(stdout_fd, STDOUT_FILENO) < 0) {
    int err = errno;
    (void)!::write(report_fd, &err, sizeof(err));
    ::_exit(127);
  }
  if (stderr_fd >= 0 && ::dup2(stderr_fd, STDERR_FILENO) < 0) {
    int err = errno;
    (void)!::write(report_fd, &err, sizeof(err));
    ::_exit(127);
  }
  ::signal(SIGPIPE, SIG_DFL);
  ::execvp(argv[0], argv);
  int err = errno;
  (void)!::write(report_fd, &err, sizeof(err));
  ::_exit(127);
}

}  // namespace

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

int FileDescriptor::Release() {
  return std::exchange(fd_, -1);
}

void FileDescriptor::reset(int new_fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = new_fd;
}

Subprocess Subprocess::Spawn(const std::vector<std::string>& argv,
                             const SubprocessOptions& options) {
  if (argv.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kBadArgument,
                "cannot spawn an empty command"};
  }

  std::vector<std::string> args_storage(argv);
  std::vector<char*> args;
  args.reserve(args_storage.size() + 1);
  for (auto& arg : args_storage) {
    args.push_back(arg.data());
  }
  args.push_back(nullptr);

  std::optional<Pipe> stdin_pipe;
  std::optional<Pipe> stdout_pipe;
  FileDescriptor devnull;
  FileDescriptor stderr_file;
  if (options.pipe_stdin) {
    stdin_pipe = Pipe::Create();
  }
  if (options.capture_stdout) {
    stdout_pipe = Pipe::Create();
  } else if (options.discard_stdout) {
    devnull.reset(::open("/dev/null", O_WRONLY | O_CLOEXEC));
    if (!devnull) {
      const int err = errno;
      throw Error{ErrorDomain::IO, errors::io::kSpawnFailed,
                  "cannot open /dev/null: " + ErrnoText(err), err};
    }
  }
  if (options.stderr_append_path) {
    stderr_file.reset(::open(options.stderr_append_path->c_str(),
                             O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640));
    if (!stderr_file) {
      const int err = errno;
      throw Error{ErrorDomain::IO, errors::io::kSpawnFailed,
                  "cannot open " + options.stderr_append_path->string() + ": " + ErrnoText(err),
                  err};
    }
  }
  Pipe report = Pipe::Create();

  const int child_stdin = stdin_pipe ? stdin_pipe->read_end.get() : -1;
  const int child_stdout = stdout_pipe ? stdout_pipe->write_end.get() : devnull.get();
  const int child_stderr = stderr_file.get();

  pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    throw Error{ErrorDomain::IO, errors::io::kSpawnFailed, "fork failed: " + ErrnoText(err), err};
  }
  if (pid == 0) {
    ExecChild(args.data(), child_stdin, child_stdout, child_stderr, report.write_end.get());
  }

  Subprocess process;
  process.pid_ = pid;
  if (stdin_pipe) {
    stdin_pipe->read_end.reset();
    process.stdin_ = std::move(stdin_pipe->write_end);
  }
  if (stdout_pipe) {
    stdout_pipe->write_end.reset();
    process.stdout_ = std::move(stdout_pipe->read_end);
  }

  // exec closes the report pipe on success; a payload means exec failed.
  report.write_end.reset();
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(report.read_end.get(), &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    process.Wait();
    throw Error{ErrorDomain::IO, errors::io::kSpawnFailed,
                "cannot execute " + argv.front() + ": " + ErrnoText(child_errno), child_errno};
  }
  return process;
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      stdin_(std::move(other.stdin_)),
      stdout_(std::move(other.stdout_)),
      exit_code_(std::exchange(other.exit_code_, std::nullopt)) {}

Subprocess& Subprocess::operator=(Subprocess&& other) noexcept {
  if (this != &other) {
    if (running()) {
      Kill(SIGKILL);
      stdin_.reset();
      stdout_.reset();
      Wait();
    }
    pid_ = std::exchange(other.pid_, -1);
    stdin_ = std::move(other.stdin_);
    stdout_ = std::move(other.stdout_);
    exit_code_ = std::exchange(other.exit_code_, std::nullopt);
  }
  return *this;
}

Subprocess::~Subprocess() {
  stdin_.reset();
  stdout_.reset();
  if (running()) {
    Kill(SIGKILL);
    Wait();
  }
}

void Subprocess::WriteStdin(std::span<const uint8_t> data) {
  if (!stdin_) {
    throw Error{ErrorDomain::State, errors::state::kStageFinished, "child stdin is closed"};
  }
  int err = 0;
  if (!WriteAll(stdin_.get(), data.data(), data.size(), &err)) {
    throw Error{ErrorDomain::IO, errors::io::kUploadWriteFailed,
                "write to child process failed: " + ErrnoText(err), err};
  }
}

void Subprocess::CloseStdin() {
  stdin_.reset();
}

std::string Subprocess::ReadStdout() {
  std::string output;
  if (!stdout_) {
    return output;
  }
  char buffer[4096];
  while (true) {
    ssize_t rc = ::read(stdout_.get(), buffer, sizeof(buffer));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      const int err = errno;
      throw Error{ErrorDomain::IO, errors::io::kPipeFailed,
                  "read from child process failed: " + ErrnoText(err), err};
    }
    if (rc == 0)
      break;
    output.append(buffer, static_cast<size_t>(rc));
  }
  stdout_.reset();
  return output;
}

int Subprocess::Wait() {
  if (exit_code_) {
    return *exit_code_;
  }
  if (pid_ <= 0) {
    throw Error{ErrorDomain::State, errors::state::kStageFinished, "no child process"};
  }
  int status = 0;
  while (::waitpid(pid_, &status, 0) < 0) {
    if (errno != EINTR) {
      const int err = errno;
      throw Error{ErrorDomain::IO, errors::io::kSpawnFailed, "waitpid failed: " + ErrnoText(err),
                  err};
    }
  }
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  } else {
    exit_code_ = 1;
  }
  return *exit_code_;
}

void Subprocess::Kill(int signal) {
  if (running()) {
    ::kill(pid_, signal);
  }
}

CommandResult RunAndCapture(const std::vector<std::string>& argv) {
  SubprocessOptions options;
  options.capture_stdout = true;
  auto process = Subprocess::Spawn(argv, options);
  CommandResult result;
  result.output = process.ReadStdout();
  result.exit_code = process.Wait();
  return result;
}

int RunCommand(const std::vector<std::string>& argv,
               const std::optional<std::filesystem::path>& stderr_append_path) {
  SubprocessOptions options;
  options.discard_stdout = true;
  options.stderr_append_path = stderr_append_path;
  auto process = Subprocess::Spawn(argv, options);
  return process.Wait();
}

std::optional<std::filesystem::path> FindExecutable(std::string_view name) {
  if (name.empty()) {
    return std::nullopt;
  }
  auto is_executable = [](const std::filesystem::path& candidate) {
    struct stat st {};
    return ::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
           ::access(candidate.c_str(), X_OK) == 0;
  };
  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path candidate{std::string(name)};
    if (is_executable(candidate)) {
      return candidate;
    }
    return std::nullopt;
  }
  const char* path_env = std::getenv("PATH");
  std::string_view search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
  while (true) {
    const auto sep = search.find(':');
    std::string_view dir = search.substr(0, sep);
    std::filesystem::path candidate = dir.empty() ? std::filesystem::path(".")
                                                  : std::filesystem::path(std::string(dir));
    candidate /= std::string(name);
    if (is_executable(candidate)) {
      return candidate;
    }
    if (sep == std::string_view::npos) {
      break;
    }
    search.remove_prefix(sep + 1);
  }
  return std::nullopt;
}

void IgnoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace fdup::platform
