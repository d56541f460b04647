#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fdup/pipeline/stream.h"
#include "fdup/platform/subprocess.h"

namespace fdup::storage {

struct UploadTarget {
  std::string bucket;
  std::string key;

  // s3://{bucket}/{key}
  std::string Url() const;
};

// Streaming upload of a single object. Finish() completes the upload and
// throws when the store rejected it; Abort() stops an upload that will not be
// finished.
class ObjectUpload : public pipeline::ByteSink {
 public:
  virtual void Abort() = 0;
};

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;
  // |expected_size| is the number of bytes that will be written, 0 when
  // unknown. Multipart clients size their parts from it.
  virtual std::unique_ptr<ObjectUpload> OpenUpload(const UploadTarget& target,
                                                   uint64_t expected_size) = 0;
  // Deletes |target|. Throws fdup::Error when the store reports a failure.
  virtual void Remove(const UploadTarget& target) = 0;
};

// Drives the AWS CLI: `aws s3 cp - <url> --expected-size <n>` fed through
// stdin, `aws s3 rm <url>`. Streams over 50 GB fail without the size hint.
// Client stderr is appended to |stderr_log| when given.
class AwsCliObjectStore final : public ObjectStore {
 public:
  explicit AwsCliObjectStore(std::vector<std::string> aws_command = {"aws"},
                             std::optional<std::filesystem::path> stderr_log = std::nullopt);

  std::unique_ptr<ObjectUpload> OpenUpload(const UploadTarget& target,
                                           uint64_t expected_size) override;
  void Remove(const UploadTarget& target) override;

 private:
  std::vector<std::string> Command(std::initializer_list<std::string> args) const;

  std::vector<std::string> aws_command_;
  std::optional<std::filesystem::path> stderr_log_;
};

}  // namespace fdup::storage
