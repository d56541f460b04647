#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>

#include "fdup/pipeline/stream.h"
#include "fdup/platform/subprocess.h"

namespace fdup::storage {

bool IsBlockDevice(const std::filesystem::path& path);

// Sequential read-only view of a block device (or a regular file standing in
// for one). The byte size comes from BLKGETSIZE64 for devices and from stat for
// files; a read that ends before that size is an error.
class DeviceReader final : public pipeline::ByteSource {
 public:
  explicit DeviceReader(const std::filesystem::path& path);

  size_t Read(std::span<uint8_t> out) override;

  [[nodiscard]] uint64_t size() const noexcept { return size_; }
  [[nodiscard]] uint64_t position() const noexcept { return position_; }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
  platform::FileDescriptor fd_;
  uint64_t size_{0};
  uint64_t position_{0};
};

// Opens device readers. The pipeline asks for a fresh reader per pass.
class DeviceOpener {
 public:
  virtual ~DeviceOpener() = default;
  virtual bool IsBlockDevice(const std::filesystem::path& path) = 0;
  virtual std::unique_ptr<pipeline::ByteSource> Open(const std::filesystem::path& path,
                                                     uint64_t* size_out) = 0;
};

class SystemDeviceOpener final : public DeviceOpener {
 public:
  bool IsBlockDevice(const std::filesystem::path& path) override;
  std::unique_ptr<pipeline::ByteSource> Open(const std::filesystem::path& path,
                                             uint64_t* size_out) override;
};

}  // namespace fdup::storage
