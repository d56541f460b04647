#include "fdup/storage/object_store.h"

#include <signal.h>

#include <iostream>
#include <string>
#include <utility>

#include "fdup/error.h"

namespace fdup::storage {

namespace {

class AwsCliUpload final : public ObjectUpload {
 public:
  AwsCliUpload(platform::Subprocess process, std::string url)
      : process_(std::move(process)), url_(std::move(url)) {}

  ~AwsCliUpload() override {
    if (done_) {
      return;
    }
    try {
      Abort();
    } catch (const Error& err) {
      std::cerr << "upload to " << url_ << ": " << err.what() << std::endl;
    }
  }

  void Write(std::span<const uint8_t> data) override {
    if (done_) {
      throw Error{ErrorDomain::State, errors::state::kStageFinished,
                  "upload to " + url_ + " already finished"};
    }
    try {
      process_.WriteStdin(data);
    } catch (const Error& err) {
      throw Error{ErrorDomain::IO, errors::io::kUploadWriteFailed,
                  "upload to " + url_ + " failed: " + err.what(), err.native_code};
    }
  }

  void Finish() override {
    if (done_) {
      return;
    }
    done_ = true;
    process_.CloseStdin();
    const int status = process_.Wait();
    if (status != 0) {
      throw Error{ErrorDomain::IO, errors::io::kUploadFailed,
                  "upload to " + url_ + " exited with status " + std::to_string(status)};
    }
  }

  void Abort() override {
    if (done_) {
      return;
    }
    done_ = true;
    process_.CloseStdin();
    process_.Kill(SIGTERM);
    process_.Wait();
  }

 private:
  platform::Subprocess process_;
  std::string url_;
  bool done_{false};
};

}  // namespace

std::string UploadTarget::Url() const {
  return "s3://" + bucket + "/" + key;
}

AwsCliObjectStore::AwsCliObjectStore(std::vector<std::string> aws_command,
                                     std::optional<std::filesystem::path> stderr_log)
    : aws_command_(std::move(aws_command)), stderr_log_(std::move(stderr_log)) {
  if (aws_command_.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kBadArgument,
                "object store command is empty"};
  }
}

std::vector<std::string> AwsCliObjectStore::Command(std::initializer_list<std::string> args) const {
  std::vector<std::string> argv = aws_command_;
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

std::unique_ptr<ObjectUpload> AwsCliObjectStore::OpenUpload(const UploadTarget& target,
                                                             uint64_t expected_size) {
  platform::IgnoreSigpipe();
  platform::SubprocessOptions options;
  options.pipe_stdin = true;
  options.stderr_append_path = stderr_log_;
  const auto url = target.Url();
  auto argv = Command({"s3", "cp", "-", url});
  if (expected_size > 0) {
    argv.push_back("--expected-size");
    argv.push_back(std::to_string(expected_size));
  }
  auto process = platform::Subprocess::Spawn(argv, options);
  return std::make_unique<AwsCliUpload>(std::move(process), url);
}

void AwsCliObjectStore::Remove(const UploadTarget& target) {
  const auto url = target.Url();
  const int status = platform::RunCommand(Command({"s3", "rm", url}), stderr_log_);
  if (status != 0) {
    throw Error{ErrorDomain::IO, errors::io::kRemoveFailed,
                "removing " + url + " exited with status " + std::to_string(status)};
  }
}

}  // namespace fdup::storage
