#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <ostream>
#include <string_view>

#include "fdup/core/integrity.h"
#include "fdup/core/output_identifier.h"
#include "fdup/orchestrator/config.h"
#include "fdup/pipeline/transfer.h"
#include "fdup/platform/status_led.h"
#include "fdup/security/secret_key.h"
#include "fdup/storage/block_device.h"
#include "fdup/storage/device_info.h"
#include "fdup/storage/object_store.h"

namespace fdup::orchestrator {

// Last stage a run reached. A failed run reports the stage that failed.
enum class RunStage {
  kListing,
  kPrivileges,
  kTools,
  kIndicator,
  kSecret,
  kDevice,
  kDigestBefore,
  kTransfer,
  kDigestAfter,
  kComplete,
};

std::string_view RunStageName(RunStage stage);

struct RunOutcome {
  RunStage stage{RunStage::kListing};
  int exit_code{1};
  bool show_usage{false};
  std::optional<core::OutputIdentifier> identifier;
  std::optional<core::IntegrityDigest> digest_before;
  std::optional<core::IntegrityDigest> digest_after;
  bool digests_match{false};
};

// Everything the controller touches outside its own process memory.
struct ControllerEnvironment {
  storage::DeviceInventory* inventory{nullptr};
  storage::DeviceOpener* devices{nullptr};
  storage::ObjectStore* store{nullptr};
  platform::StatusIndicator* indicator{nullptr};  // null when the LED is disabled
  std::function<bool()> is_root;
  std::function<std::optional<std::filesystem::path>(std::string_view)> find_tool;
  std::function<std::chrono::system_clock::time_point()> now;
  pipeline::InterruptCheck interrupted;
  std::ostream* listing_out{nullptr};   // disk listing
  std::ostream* progress_out{nullptr};  // transfer progress
};

// Runs hash-before, encrypt-and-upload, hash-after and the comparison, with
// the precondition checks in front and remote cleanup on transfer failure.
// Progress and results are published on the EventBus.
class DuplicationController {
 public:
  DuplicationController(ImagerConfig config, ControllerEnvironment env);

  RunOutcome Run(std::optional<security::SecretKey> secret);
  RunOutcome ListDisks();

 private:
  bool CheckTools();
  void PrintDiskList();
  core::OutputIdentifier IdentifyDevice();
  core::IntegrityDigest HashDevice();
  bool Transfer(const security::SecretKey& secret, const storage::UploadTarget& target);
  void RemoveIncompleteUpload(const storage::UploadTarget& target);

  ImagerConfig config_;
  ControllerEnvironment env_;
};

// Production collaborators for a config: lsblk, the AWS CLI, the gpio LED.
// Object store client stderr is appended to |client_log| when given.
struct SystemCollaborators {
  SystemCollaborators(const ImagerConfig& config,
                      std::optional<std::filesystem::path> client_log);

  storage::LsblkInventory inventory;
  storage::SystemDeviceOpener devices;
  storage::AwsCliObjectStore store;
  std::optional<platform::GpioStatusLed> led;
};

ControllerEnvironment MakeSystemEnvironment(SystemCollaborators& collaborators,
                                            pipeline::InterruptCheck interrupted);

}  // namespace fdup::orchestrator
