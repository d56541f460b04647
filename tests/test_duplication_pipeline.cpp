#include "fdup/error.h"
#include "fdup/orchestrator/duplication_pipeline.h"
#include "fdup/orchestrator/event_bus.h"
#include "fdup/pipeline/stream.h"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace {

using fdup::orchestrator::EventSeverity;
using fdup::orchestrator::RunStage;

const std::string kPassphrase = "mySecretKey";

std::vector<uint8_t> Pattern(size_t size, uint8_t seed) {
  std::vector<uint8_t> data(size);
  for (size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>(i * 13u + seed);
  }
  return data;
}

std::vector<uint8_t> OpenSslEncDecrypt(const std::vector<uint8_t>& container) {
  assert(container.size() >= 32);
  assert(std::memcmp(container.data(), "Salted__", 8) == 0);
  std::array<uint8_t, 48> derived{};
  int rc = PKCS5_PBKDF2_HMAC(kPassphrase.data(), static_cast<int>(kPassphrase.size()),
                             container.data() + 8, 8, 10000, EVP_sha256(),
                             static_cast<int>(derived.size()), derived.data());
  assert(rc == 1);
  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  rc = EVP_DecryptInit_ex(ctx, EVP_aes_256_cbc(), nullptr, derived.data(), derived.data() + 32);
  assert(rc == 1);
  std::vector<uint8_t> plain(container.size());
  int len = 0;
  rc = EVP_DecryptUpdate(ctx, plain.data(), &len, container.data() + 16,
                         static_cast<int>(container.size() - 16));
  assert(rc == 1);
  int total = len;
  rc = EVP_DecryptFinal_ex(ctx, plain.data() + total, &len);
  assert(rc == 1);
  total += len;
  EVP_CIPHER_CTX_free(ctx);
  plain.resize(static_cast<size_t>(total));
  return plain;
}

class FakeInventory final : public fdup::storage::DeviceInventory {
 public:
  fdup::storage::DeviceMetadata Describe(const std::filesystem::path& device) override {
    described.push_back(device.string());
    if (describe_fails) {
      throw fdup::Error{fdup::ErrorDomain::IO, fdup::errors::io::kSpawnFailed, "lsblk exploded"};
    }
    return metadata;
  }

  std::vector<fdup::storage::DiskEntry> ListUnmountedDisks() override {
    ++list_calls;
    return disks;
  }

  fdup::storage::DeviceMetadata metadata;
  std::vector<fdup::storage::DiskEntry> disks;
  std::vector<std::string> described;
  bool describe_fails{false};
  int list_calls{0};
};

class FakeDevices final : public fdup::storage::DeviceOpener {
 public:
  bool IsBlockDevice(const std::filesystem::path&) override {
    ++block_checks;
    return is_block;
  }

  std::unique_ptr<fdup::pipeline::ByteSource> Open(const std::filesystem::path&,
                                                   uint64_t* size_out) override {
    if (fail_on_open && opens == *fail_on_open) {
      ++opens;
      throw fdup::Error{fdup::ErrorDomain::IO, fdup::errors::io::kDeviceOpenFailed,
                        "device vanished", ENODEV};
    }
    const auto& content = passes[std::min(opens, passes.size() - 1)];
    ++opens;
    if (size_out) {
      *size_out = content.size();
    }
    return std::make_unique<fdup::pipeline::MemorySource>(content);
  }

  std::vector<std::vector<uint8_t>> passes;
  bool is_block{true};
  std::optional<size_t> fail_on_open;  // zero-based index of the Open call that fails
  size_t opens{0};
  int block_checks{0};
};

class FakeStore final : public fdup::storage::ObjectStore {
 public:
  class Upload final : public fdup::storage::ObjectUpload {
   public:
    explicit Upload(FakeStore& store) : store_(store) {}

    void Write(std::span<const uint8_t> data) override {
      if (store_.fail_after_bytes && store_.object.size() + data.size() > *store_.fail_after_bytes) {
        throw fdup::Error{fdup::ErrorDomain::IO, fdup::errors::io::kUploadWriteFailed,
                          "connection reset", EPIPE};
      }
      store_.object.insert(store_.object.end(), data.begin(), data.end());
    }

    void Finish() override { store_.finished = true; }
    void Abort() override { store_.aborted = true; }

   private:
    FakeStore& store_;
  };

  std::unique_ptr<fdup::storage::ObjectUpload> OpenUpload(
      const fdup::storage::UploadTarget& target, uint64_t size_hint) override {
    uploaded_url = target.Url();
    expected_size = size_hint;
    return std::make_unique<Upload>(*this);
  }

  void Remove(const fdup::storage::UploadTarget& target) override {
    removed.push_back(target.Url());
    if (remove_fails) {
      throw fdup::Error{fdup::ErrorDomain::IO, fdup::errors::io::kRemoveFailed, "access denied"};
    }
  }

  std::vector<uint8_t> object;
  std::optional<size_t> fail_after_bytes;
  std::string uploaded_url;
  uint64_t expected_size{0};
  std::vector<std::string> removed;
  bool remove_fails{false};
  bool finished{false};
  bool aborted{false};
};

class RecordingIndicator final : public fdup::platform::StatusIndicator {
 public:
  void Setup() override {
    std::lock_guard<std::mutex> lock(mutex);
    setup = true;
    states.push_back(false);
  }
  void Set(bool on) override {
    std::lock_guard<std::mutex> lock(mutex);
    states.push_back(on);
  }
  std::vector<bool> Snapshot() {
    std::lock_guard<std::mutex> lock(mutex);
    return states;
  }

  std::mutex mutex;
  std::vector<bool> states;
  bool setup{false};
};

struct LoggedEvent {
  EventSeverity severity;
  std::string message;
};

// One controller with fakes around it and the events it published.
struct Harness {
  Harness() {
    fdup::orchestrator::ResetEventBusForTesting();
    fdup::orchestrator::EventBus::Instance().Subscribe(
        [this](const fdup::orchestrator::Event& event) {
          events.push_back({event.severity, event.message});
        });
    inventory.metadata.model = "ACME";
    inventory.metadata.serial = "SN123";
    inventory.metadata.size = "32G";
    inventory.disks = {{"/dev/sdb", "32G"}, {"/dev/sdc", "1.8T"}};
    devices.passes = {Pattern(50000, 1)};
    config.mode = fdup::orchestrator::RunMode::kDuplicate;
    config.source_device = "/dev/sdb";
    config.bucket = "my-forensic-bucket";
    config.block_size = 4096;
    config.blink_half_period = std::chrono::milliseconds(2);
  }

  ~Harness() { fdup::orchestrator::ResetEventBusForTesting(); }

  fdup::orchestrator::RunOutcome Run(bool with_key = true) {
    return Controller().Run(with_key ? std::optional<fdup::security::SecretKey>(Key())
                                     : std::nullopt);
  }

  fdup::orchestrator::DuplicationController Controller() {
    fdup::orchestrator::ControllerEnvironment env;
    env.inventory = &inventory;
    env.devices = &devices;
    env.store = &store;
    env.indicator = with_led ? &led : nullptr;
    env.is_root = [this] { return root; };
    env.find_tool = [this](std::string_view name) -> std::optional<std::filesystem::path> {
      if (tools.count(std::string(name)) == 0) {
        return std::nullopt;
      }
      return std::filesystem::path("/usr/bin") / std::string(name);
    };
    env.now = [] {
      std::tm local{};
      local.tm_year = 2024 - 1900;
      local.tm_mon = 0;
      local.tm_mday = 1;
      local.tm_hour = 12;
      local.tm_isdst = -1;
      return std::chrono::system_clock::from_time_t(std::mktime(&local));
    };
    env.interrupted = [this] { return interrupt_after_polls >= 0 && polls++ >= interrupt_after_polls; };
    env.listing_out = &listing;
    env.progress_out = &progress;
    return fdup::orchestrator::DuplicationController(config, env);
  }

  static fdup::security::SecretKey Key() {
    return fdup::security::SecretKey(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(kPassphrase.data()), kPassphrase.size()));
  }

  bool Logged(EventSeverity severity, const std::string& needle) const {
    return std::any_of(events.begin(), events.end(), [&](const LoggedEvent& e) {
      return e.severity == severity && e.message.find(needle) != std::string::npos;
    });
  }

  bool LoggedAnywhere(const std::string& needle) const {
    return std::any_of(events.begin(), events.end(), [&](const LoggedEvent& e) {
      return e.message.find(needle) != std::string::npos;
    });
  }

  FakeInventory inventory;
  FakeDevices devices;
  FakeStore store;
  RecordingIndicator led;
  fdup::orchestrator::ImagerConfig config;
  std::set<std::string> tools{"lsblk", "aws", "gpio"};
  bool root{true};
  bool with_led{false};
  int interrupt_after_polls{-1};
  int polls{0};
  std::ostringstream listing;
  std::ostringstream progress;
  std::vector<LoggedEvent> events;
};

void TestSuccessfulRun() {
  Harness h;
  h.with_led = true;
  h.config.gpio_enabled = true;
  const auto outcome = h.Run();
  assert(outcome.exit_code == 0);
  assert(outcome.stage == RunStage::kComplete);
  assert(outcome.identifier.has_value());
  assert(outcome.identifier->FileName() == "20240101_120000_ACME_SN123_32G.img.enc");
  assert(h.store.uploaded_url ==
         "s3://my-forensic-bucket/20240101_120000_ACME_SN123_32G.img.enc");
  assert(h.store.finished);
  assert(!h.store.aborted);
  assert(h.store.removed.empty());
  assert(h.store.expected_size == h.store.object.size());
  assert(OpenSslEncDecrypt(h.store.object) == h.devices.passes[0]);
  assert(h.devices.opens == 3);

  assert(outcome.digests_match);
  assert(outcome.digest_before->bytes == 50000);
  assert(outcome.digest_before == outcome.digest_after);
  assert(h.Logged(EventSeverity::kInfo, "SHA256 hash verification successful"));
  assert(h.Logged(EventSeverity::kInfo,
                  "Encrypted disk image uploaded to s3://my-forensic-bucket/20240101_120000_ACME_SN123_32G.img.enc"));
  assert(h.Logged(EventSeverity::kInfo, "Please store the SHA256 hash securely"));
  assert(h.Logged(EventSeverity::kInfo, "Disk duplication completed successfully"));
  assert(h.Logged(EventSeverity::kInfo, "  Model: ACME"));
  assert(h.Logged(EventSeverity::kInfo, "re-reads the entire device"));
  assert(h.Logged(EventSeverity::kInfo, "Cleaning up GPIO..."));
  assert(h.progress.str().find("100%") != std::string::npos);

  const auto states = h.led.Snapshot();
  assert(h.led.setup);
  // Blinking, then solid on after the transfer, then off when the run ends.
  assert(states.size() >= 3);
  assert(states[states.size() - 2] == true);
  assert(states.back() == false);
}

void TestMissingKeyStopsBeforeDeviceAccess() {
  Harness h;
  h.with_led = true;
  h.config.gpio_enabled = true;
  const auto outcome = h.Run(false);
  assert(outcome.exit_code == 1);
  assert(outcome.stage == RunStage::kSecret);
  assert(outcome.show_usage);
  assert(h.devices.opens == 0);
  assert(h.devices.block_checks == 0);
  assert(h.inventory.described.empty());
  assert(h.store.uploaded_url.empty());
  assert(h.Logged(EventSeverity::kError, "ENCRYPTION_KEY environment variable is not set."));
  assert(h.led.Snapshot().back() == false);
}

void TestEmptyKeyCountsAsMissing() {
  Harness h;
  const auto outcome = h.Controller().Run(fdup::security::SecretKey());
  assert(outcome.exit_code == 1);
  assert(outcome.stage == RunStage::kSecret);
}

void TestUploadFailureRemovesPartialObject() {
  Harness h;
  h.with_led = true;
  h.config.gpio_enabled = true;
  h.store.fail_after_bytes = 20000;
  const auto outcome = h.Run();
  assert(outcome.exit_code == 1);
  assert(outcome.stage == RunStage::kTransfer);
  assert(h.store.aborted);
  assert(!h.store.finished);
  assert(h.store.removed.size() == 1);
  assert(h.store.removed[0] == h.store.uploaded_url);
  assert(h.Logged(EventSeverity::kError, "Disk duplication failed"));
  assert(h.Logged(EventSeverity::kInfo, "Removing incomplete upload from S3..."));
  assert(!h.LoggedAnywhere("completed successfully"));
  assert(!h.LoggedAnywhere("uploaded to"));
  assert(!outcome.digest_after.has_value());
  assert(h.devices.opens == 2);
  assert(h.led.Snapshot().back() == false);
}

void TestCleanupFailureIsOnlyAWarning() {
  Harness h;
  h.store.fail_after_bytes = 100;
  h.store.remove_fails = true;
  const auto outcome = h.Run();
  assert(outcome.exit_code == 1);
  assert(outcome.stage == RunStage::kTransfer);
  assert(h.Logged(EventSeverity::kWarning, "Manual cleanup may be necessary"));
}

void TestInterruptAbortsTransfer() {
  Harness h;
  // Hash-before polls once per block plus once at EOF.
  h.interrupt_after_polls = static_cast<int>(50000 / 4096 + 2) + 3;
  const auto outcome = h.Run();
  assert(outcome.exit_code == 1);
  assert(outcome.stage == RunStage::kTransfer);
  assert(h.store.removed.size() == 1);
  assert(h.Logged(EventSeverity::kError, "Disk duplication failed: interrupted by signal"));
}

void TestInterruptDuringHashPass() {
  Harness h;
  h.interrupt_after_polls = 2;
  const auto outcome = h.Run();
  assert(outcome.exit_code == 1);
  assert(outcome.stage == RunStage::kDigestBefore);
  assert(h.store.uploaded_url.empty());
  assert(h.Logged(EventSeverity::kError, "Could not hash source device: interrupted by signal"));
  assert(!h.LoggedAnywhere("Transfer"));
}

void TestDigestMismatchIsWarningOnly() {
  Harness h;
  auto changed = Pattern(50000, 1);
  changed[123] ^= 0xFF;
  h.devices.passes = {Pattern(50000, 1), Pattern(50000, 1), changed};
  const auto outcome = h.Run();
  assert(outcome.exit_code == 0);
  assert(outcome.stage == RunStage::kComplete);
  assert(!outcome.digests_match);
  assert(h.Logged(EventSeverity::kWarning, "SHA256 hash mismatch"));
  assert(h.Logged(EventSeverity::kInfo, "  Before: " + outcome.digest_before->hex));
  assert(h.Logged(EventSeverity::kInfo, "  After:  " + outcome.digest_after->hex));
  assert(!h.LoggedAnywhere("verification successful"));
}

void TestDigestAfterFailureKeepsUpload() {
  Harness h;
  h.devices.fail_on_open = 2;
  const auto outcome = h.Run();
  assert(outcome.exit_code == 1);
  assert(outcome.stage == RunStage::kDigestAfter);
  assert(h.devices.opens == 3);
  assert(h.store.finished);
  assert(h.store.removed.empty());
  assert(outcome.digest_before.has_value());
  assert(!outcome.digest_after.has_value());
  assert(h.Logged(EventSeverity::kInfo, "Disk duplication completed successfully"));
  assert(h.Logged(EventSeverity::kError, "device vanished"));
  assert(!h.LoggedAnywhere("uploaded to"));
}

void TestPreconditionOrder() {
  {
    Harness h;
    h.root = false;
    h.tools.clear();
    const auto outcome = h.Run(false);
    assert(outcome.stage == RunStage::kPrivileges);
    assert(outcome.exit_code == 1);
    assert(h.Logged(EventSeverity::kError, "Please run as root"));
  }
  {
    Harness h;
    h.tools.erase("aws");
    const auto outcome = h.Run(false);
    assert(outcome.stage == RunStage::kTools);
    assert(h.Logged(EventSeverity::kError, "aws could not be found"));
  }
  {
    Harness h;
    h.tools.erase("gpio");
    h.config.gpio_enabled = true;
    h.with_led = true;
    const auto outcome = h.Run();
    assert(outcome.stage == RunStage::kTools);
    assert(h.Logged(EventSeverity::kError, "Please install wiringpi."));
    assert(!h.led.setup);
  }
}

void TestInvalidDeviceListsCandidates() {
  Harness h;
  h.devices.is_block = false;
  const auto outcome = h.Run();
  assert(outcome.exit_code == 1);
  assert(outcome.stage == RunStage::kDevice);
  assert(h.devices.opens == 0);
  assert(h.Logged(EventSeverity::kError, "/dev/sdb is not a valid block device."));
  assert(h.listing.str() == "/dev/sdb (32G)\n/dev/sdc (1.8T)\n");
}

void TestListingNeedsNoKeyOrRoot() {
  Harness h;
  h.root = false;
  const auto outcome = h.Controller().ListDisks();
  assert(outcome.exit_code == 0);
  assert(outcome.stage == RunStage::kListing);
  assert(h.inventory.list_calls == 1);
  assert(h.listing.str() == "/dev/sdb (32G)\n/dev/sdc (1.8T)\n");
  assert(h.Logged(EventSeverity::kInfo, "Listing available unmounted disks:"));
}

void TestMetadataFailureFallsBack() {
  Harness h;
  h.inventory.describe_fails = true;
  const auto outcome = h.Run();
  assert(outcome.exit_code == 0);
  assert(outcome.identifier->FileName() ==
         "20240101_120000_unknown_model_no_serial_sdb_unknown_size.img.enc");
  assert(h.Logged(EventSeverity::kWarning, "lsblk exploded"));
}

void TestStageNames() {
  assert(fdup::orchestrator::RunStageName(RunStage::kTransfer) == "transfer");
  assert(fdup::orchestrator::RunStageName(RunStage::kComplete) == "complete");
}

}  // namespace

int main() {
  TestSuccessfulRun();
  TestMissingKeyStopsBeforeDeviceAccess();
  TestEmptyKeyCountsAsMissing();
  TestUploadFailureRemovesPartialObject();
  TestCleanupFailureIsOnlyAWarning();
  TestInterruptAbortsTransfer();
  TestInterruptDuringHashPass();
  TestDigestMismatchIsWarningOnly();
  TestDigestAfterFailureKeepsUpload();
  TestPreconditionOrder();
  TestInvalidDeviceListsCandidates();
  TestListingNeedsNoKeyOrRoot();
  TestMetadataFailureFallsBack();
  TestStageNames();
  std::cout << "duplication pipeline tests ok\n";
  return 0;
}
