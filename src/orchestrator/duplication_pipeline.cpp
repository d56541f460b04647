#include "fdup/orchestrator/duplication_pipeline.h"

#include <unistd.h>

#include <exception>
#include <iostream>
#include <utility>

#include "fdup/common.h"
#include "fdup/crypto/enc_format.h"
#include "fdup/error.h"
#include "fdup/errors.h"
#include "fdup/orchestrator/event_bus.h"
#include "fdup/pipeline/encrypting_sink.h"
#include "fdup/pipeline/progress_meter.h"
#include "fdup/platform/subprocess.h"

namespace fdup::orchestrator {

namespace {

RunOutcome Finish(RunOutcome outcome, RunStage stage, int exit_code) {
  outcome.stage = stage;
  outcome.exit_code = exit_code;
  return outcome;
}

// Announces the LED cleanup. Declared after the off-guard, so it is destroyed
// first and the notice precedes the off write.
struct GpioCleanupNotice {
  bool active{false};
  ~GpioCleanupNotice() {
    if (active) {
      LogInfo("gpio_cleanup", "Cleaning up GPIO...");
    }
  }
};

} // namespace

std::string_view RunStageName(RunStage stage) {
  switch (stage) {
  case RunStage::kListing:
    return "listing";
  case RunStage::kPrivileges:
    return "privileges";
  case RunStage::kTools:
    return "tools";
  case RunStage::kIndicator:
    return "indicator";
  case RunStage::kSecret:
    return "secret";
  case RunStage::kDevice:
    return "device";
  case RunStage::kDigestBefore:
    return "digest-before";
  case RunStage::kTransfer:
    return "transfer";
  case RunStage::kDigestAfter:
    return "digest-after";
  case RunStage::kComplete:
    return "complete";
  }
  return "unknown";
}

DuplicationController::DuplicationController(ImagerConfig config, ControllerEnvironment env)
    : config_(std::move(config)), env_(std::move(env)) {
  if (!env_.inventory || !env_.devices || !env_.store) {
    throw Error{ErrorDomain::Validation, errors::validation::kBadArgument,
                "controller collaborators are missing"};
  }
  if (!env_.is_root) {
    env_.is_root = [] { return ::geteuid() == 0; };
  }
  if (!env_.find_tool) {
    env_.find_tool = [](std::string_view name) { return platform::FindExecutable(name); };
  }
  if (!env_.now) {
    env_.now = [] { return std::chrono::system_clock::now(); };
  }
  if (!env_.listing_out) {
    env_.listing_out = &std::cout;
  }
  if (!env_.progress_out) {
    env_.progress_out = &std::cerr;
  }
}

void DuplicationController::PrintDiskList() {
  LogInfo("disk_listing", "Listing available unmounted disks:");
  try {
    for (const auto& disk : env_.inventory->ListUnmountedDisks()) {
      *env_.listing_out << storage::FormatDiskEntry(disk) << std::endl;
    }
  } catch (const Error& err) {
    LogWarning("disk_listing_failed", std::string("Could not list disks: ") + err.what());
  }
}

RunOutcome DuplicationController::ListDisks() {
  PrintDiskList();
  return Finish(RunOutcome{}, RunStage::kListing, 0);
}

bool DuplicationController::CheckTools() {
  for (const auto& tool : config_.required_tools) {
    if (!env_.find_tool(tool)) {
      LogError("tool_missing", tool + " could not be found. Please install it.");
      return false;
    }
  }
  if (config_.gpio_enabled && !env_.find_tool(config_.gpio_tool)) {
    LogError("tool_missing", std::string(errors::msg::kGpioToolMissing));
    return false;
  }
  LogInfo("tools_ok", "All required commands are available.");
  return true;
}

core::OutputIdentifier DuplicationController::IdentifyDevice() {
  storage::DeviceMetadata metadata;
  try {
    metadata = env_.inventory->Describe(config_.source_device);
  } catch (const Error& err) {
    LogWarning("device_metadata_unavailable",
               std::string("Could not read device metadata, using fallbacks: ") + err.what());
  }
  auto id = core::BuildOutputIdentifier(metadata, config_.source_device, env_.now());
  LogInfo("output_identifier", "Generated output filename: " + id.FileName());
  LogInfo("output_identifier", "Filename components:");
  LogInfo("output_identifier", "  Timestamp: " + id.timestamp);
  LogInfo("output_identifier", "  Model: " + id.model);
  LogInfo("output_identifier", "  Serial: " + id.serial);
  LogInfo("output_identifier", "  Size: " + id.size);
  return id;
}

core::IntegrityDigest DuplicationController::HashDevice() {
  const auto device = PathToUtf8String(config_.source_device);
  uint64_t size = 0;
  auto source = env_.devices->Open(config_.source_device, &size);
  LogInfo("digest_start", "Calculating SHA256 hash of " + device + " (" + FormatByteCount(size) +
                              "; this re-reads the entire device)...");
  auto digest = core::ComputeDigest(*source, config_.block_size, env_.interrupted);
  LogInfo("digest_done", "SHA256 hash: " + digest.hex + " (" + std::to_string(digest.bytes) +
                             " bytes)");
  return digest;
}

void DuplicationController::RemoveIncompleteUpload(const storage::UploadTarget& target) {
  LogInfo("upload_cleanup", "Removing incomplete upload from S3...");
  try {
    env_.store->Remove(target);
  } catch (const Error& err) {
    LogWarning("upload_cleanup_failed",
               std::string(errors::msg::kRemoveIncompleteFailed) + " (" + err.what() + ")");
  }
}

bool DuplicationController::Transfer(const security::SecretKey& secret,
                                     const storage::UploadTarget& target) {
  std::optional<platform::BlinkTask> blink;
  if (env_.indicator) {
    blink.emplace(*env_.indicator, config_.blink_half_period);
    blink->Start();
  }
  auto settle_indicator = [&blink](bool success) {
    if (!blink) {
      return;
    }
    try {
      blink->Stop(success);
    } catch (const Error& err) {
      LogWarning("indicator_failed", std::string("Status LED update failed: ") + err.what());
    }
    if (auto thread_error = blink->thread_error()) {
      LogWarning("indicator_failed", "Status LED blinking stopped: " + *thread_error);
    }
  };

  std::unique_ptr<storage::ObjectUpload> upload;
  try {
    uint64_t size = 0;
    auto source = env_.devices->Open(config_.source_device, &size);
    const uint64_t encrypted_size = crypto::EncryptedSize(size);
    upload = env_.store->OpenUpload(target, encrypted_size);
    pipeline::ProgressMeter meter(*upload, encrypted_size, *env_.progress_out);
    pipeline::EncryptingSink encryptor(meter, secret.bytes(), config_.pbkdf2_iterations);
    pipeline::Relay(*source, encryptor, config_.block_size, env_.interrupted);
  } catch (const std::exception& err) {
    if (upload) {
      try {
        upload->Abort();
      } catch (const Error& abort_err) {
        LogWarning("upload_abort_failed", std::string("Upload client did not stop cleanly: ") +
                                              abort_err.what());
      }
    }
    upload.reset();
    LogError("duplication_failed", std::string(errors::msg::kDuplicationFailed) + ": " +
                                       err.what());
    RemoveIncompleteUpload(target);
    settle_indicator(false);
    return false;
  }
  upload.reset();
  settle_indicator(true);
  return true;
}

RunOutcome DuplicationController::Run(std::optional<security::SecretKey> secret) {
  RunOutcome outcome;

  if (!env_.is_root()) {
    LogError("not_root", std::string(errors::msg::kRunAsRoot));
    return Finish(std::move(outcome), RunStage::kPrivileges, 1);
  }

  if (!CheckTools()) {
    return Finish(std::move(outcome), RunStage::kTools, 1);
  }

  if (env_.indicator) {
    LogInfo("gpio_setup", "Setting up GPIO...");
    try {
      env_.indicator->Setup();
    } catch (const Error& err) {
      LogError("gpio_setup_failed", std::string("GPIO setup failed: ") + err.what());
      return Finish(std::move(outcome), RunStage::kIndicator, 1);
    }
  }
  platform::IndicatorOffGuard indicator_guard(env_.indicator);
  GpioCleanupNotice cleanup_notice{env_.indicator != nullptr};

  if (!secret || secret->empty()) {
    LogError("missing_secret", std::string(errors::msg::kMissingEncryptionKey));
    outcome.show_usage = true;
    return Finish(std::move(outcome), RunStage::kSecret, 1);
  }

  if (!env_.devices->IsBlockDevice(config_.source_device)) {
    LogError("invalid_device",
             PathToUtf8String(config_.source_device) + " is not a valid block device.");
    PrintDiskList();
    return Finish(std::move(outcome), RunStage::kDevice, 1);
  }

  const auto id = IdentifyDevice();
  outcome.identifier = id;
  const storage::UploadTarget target{config_.bucket, id.FileName()};

  try {
    outcome.digest_before = HashDevice();
  } catch (const Error& err) {
    LogError("digest_failed", std::string("Could not hash source device: ") + err.what());
    return Finish(std::move(outcome), RunStage::kDigestBefore, 1);
  }

  LogInfo("duplication_start",
          "Starting disk duplication of " + PathToUtf8String(config_.source_device));
  if (!Transfer(*secret, target)) {
    return Finish(std::move(outcome), RunStage::kTransfer, 1);
  }
  secret->Clear();
  LogInfo("duplication_done", "Disk duplication completed successfully");

  try {
    outcome.digest_after = HashDevice();
  } catch (const Error& err) {
    LogError("digest_failed", std::string("Could not hash source device: ") + err.what());
    return Finish(std::move(outcome), RunStage::kDigestAfter, 1);
  }

  outcome.digests_match = (*outcome.digest_before == *outcome.digest_after);
  if (!outcome.digests_match) {
    LogWarning("digest_mismatch", std::string(errors::msg::kDigestMismatch));
    LogInfo("digest_mismatch", "  Before: " + outcome.digest_before->hex + " (" +
                                   std::to_string(outcome.digest_before->bytes) + " bytes)");
    LogInfo("digest_mismatch", "  After:  " + outcome.digest_after->hex + " (" +
                                   std::to_string(outcome.digest_after->bytes) + " bytes)");
  } else {
    LogInfo("digest_verified", std::string(errors::msg::kDigestVerified));
  }

  LogInfo("upload_location", "Encrypted disk image uploaded to " + target.Url());
  LogInfo("digest_reminder", std::string(errors::msg::kStoreDigestReminder));
  LogInfo("run_complete", "fdup completed successfully");
  return Finish(std::move(outcome), RunStage::kComplete, 0);
}

SystemCollaborators::SystemCollaborators(const ImagerConfig& config,
                                         std::optional<std::filesystem::path> client_log)
    : inventory(config.lsblk_tool), store(config.aws_command, std::move(client_log)) {
  if (config.gpio_enabled) {
    led.emplace(config.gpio_tool, config.led_pin);
  }
}

ControllerEnvironment MakeSystemEnvironment(SystemCollaborators& collaborators,
                                            pipeline::InterruptCheck interrupted) {
  ControllerEnvironment env;
  env.inventory = &collaborators.inventory;
  env.devices = &collaborators.devices;
  env.store = &collaborators.store;
  env.indicator = collaborators.led ? &*collaborators.led : nullptr;
  env.interrupted = std::move(interrupted);
  return env;
}

} // namespace fdup::orchestrator
