#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace fdup::platform {

// Owning wrapper around a POSIX descriptor. Move-only.
class FileDescriptor {
 public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {}

  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  ~FileDescriptor() { reset(); }

  int get() const { return fd_; }
  explicit operator bool() const { return fd_ >= 0; }

  int Release();
  void reset(int new_fd = -1);

 private:
  int fd_{-1};
};

struct SubprocessOptions {
  bool pipe_stdin{false};      // parent writes the child's stdin
  bool capture_stdout{false};  // parent reads the child's stdout
  bool discard_stdout{false};  // child stdout goes to /dev/null
  // When set, child stderr is appended to this file instead of inherited.
  std::optional<std::filesystem::path> stderr_append_path;
};

// A spawned child process. The destructor kills and reaps a child that was not
// waited for.
class Subprocess {
 public:
  static Subprocess Spawn(const std::vector<std::string>& argv,
                          const SubprocessOptions& options = {});

  Subprocess(Subprocess&& other) noexcept;
  Subprocess& operator=(Subprocess&& other) noexcept;
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  ~Subprocess();

  // Writes every byte to the child's stdin. Throws fdup::Error (IO) when the
  // child has gone away (EPIPE) or the write fails.
  void WriteStdin(std::span<const uint8_t> data);
  void CloseStdin();

  // Reads the child's stdout until EOF.
  std::string ReadStdout();

  // Blocks until the child exits. Returns the exit status, or 128 + signal
  // number when the child was killed.
  int Wait();

  void Kill(int signal);

  pid_t pid() const { return pid_; }
  bool running() const { return pid_ > 0 && !exit_code_; }

 private:
  Subprocess() = default;

  pid_t pid_{-1};
  FileDescriptor stdin_;
  FileDescriptor stdout_;
  std::optional<int> exit_code_;
};

struct CommandResult {
  int exit_code{-1};
  std::string output;
};

// Runs |argv| to completion and collects stdout.
CommandResult RunAndCapture(const std::vector<std::string>& argv);

// Runs |argv| to completion with stdout discarded. Returns the exit status.
int RunCommand(const std::vector<std::string>& argv,
               const std::optional<std::filesystem::path>& stderr_append_path = std::nullopt);

// Resolves |name| against PATH. Names containing '/' are checked as given.
std::optional<std::filesystem::path> FindExecutable(std::string_view name);

// Makes writes to a closed pipe fail with EPIPE instead of killing the process.
void IgnoreSigpipe();

}  // namespace fdup::platform
