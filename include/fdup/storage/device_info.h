#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fdup::storage {

// Fields reported by lsblk for a single device. Values are unescaped and
// trimmed; missing fields are empty.
struct DeviceMetadata {
  std::string name;
  std::string model;
  std::string serial;
  std::string size;
  std::string vendor;
  std::string uuid;
  std::string type;
  std::string mountpoint;
};

struct DiskEntry {
  std::string path;
  std::string size;
};

using LsblkRecord = std::map<std::string, std::string>;

// Parses `lsblk -P` output: one device per line, KEY="value" pairs with \xNN
// escapes.
std::vector<LsblkRecord> ParseLsblkPairs(std::string_view output);
DeviceMetadata MetadataFromRecord(const LsblkRecord& record);

// Whole disks from `lsblk -P -o NAME,PKNAME,SIZE,TYPE,MOUNTPOINT` output
// (all devices, not just disks) where neither the disk nor any device below it
// is mounted.
std::vector<DiskEntry> UnmountedDisks(const std::vector<LsblkRecord>& records);

// "{path} ({size})"
std::string FormatDiskEntry(const DiskEntry& entry);

class DeviceInventory {
 public:
  virtual ~DeviceInventory() = default;
  // Throws fdup::Error when the enumeration tool cannot be run or fails.
  virtual DeviceMetadata Describe(const std::filesystem::path& device) = 0;
  // Whole disks with nothing mounted on them or their partitions.
  virtual std::vector<DiskEntry> ListUnmountedDisks() = 0;
};

class LsblkInventory final : public DeviceInventory {
 public:
  explicit LsblkInventory(std::string lsblk_tool = "lsblk");

  DeviceMetadata Describe(const std::filesystem::path& device) override;
  std::vector<DiskEntry> ListUnmountedDisks() override;

 private:
  std::string Query(const std::vector<std::string>& argv);

  std::string lsblk_tool_;
};

}  // namespace fdup::storage
