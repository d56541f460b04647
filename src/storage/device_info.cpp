#include "fdup/storage/device_info.h"

#include <cctype>
#include <set>
#include <utility>

#include "fdup/error.h"
#include "fdup/platform/subprocess.h"

namespace fdup::storage {

namespace {

constexpr char kDescribeColumns[] = "NAME,MODEL,SERIAL,SIZE,VENDOR,UUID,TYPE,MOUNTPOINT";
constexpr char kListColumns[] = "NAME,PKNAME,SIZE,TYPE,MOUNTPOINT";

int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::string Trim(std::string value) {
  size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin]))) {
    ++begin;
  }
  size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(begin, end - begin);
}

std::string Field(const LsblkRecord& record, const char* key) {
  auto it = record.find(key);
  return it == record.end() ? std::string{} : Trim(it->second);
}

// Parses one line; malformed tails are dropped.
LsblkRecord ParseLine(std::string_view line) {
  LsblkRecord record;
  size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && line[pos] == ' ') {
      ++pos;
    }
    const size_t eq = line.find('=', pos);
    if (eq == std::string_view::npos || eq + 1 >= line.size() || line[eq + 1] != '"') {
      break;
    }
    std::string key(line.substr(pos, eq - pos));
    std::string value;
    size_t i = eq + 2;
    bool closed = false;
    while (i < line.size()) {
      const char c = line[i];
      if (c == '"') {
        closed = true;
        ++i;
        break;
      }
      if (c == '\\' && i + 3 < line.size() && line[i + 1] == 'x') {
        const int hi = HexValue(line[i + 2]);
        const int lo = HexValue(line[i + 3]);
        if (hi >= 0 && lo >= 0) {
          value.push_back(static_cast<char>(hi * 16 + lo));
          i += 4;
          continue;
        }
      }
      value.push_back(c);
      ++i;
    }
    if (!closed) {
      break;
    }
    record.emplace(std::move(key), std::move(value));
    pos = i;
  }
  return record;
}

}  // namespace

std::vector<LsblkRecord> ParseLsblkPairs(std::string_view output) {
  std::vector<LsblkRecord> records;
  while (!output.empty()) {
    const size_t nl = output.find('\n');
    std::string_view line = output.substr(0, nl);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    auto record = ParseLine(line);
    if (!record.empty()) {
      records.push_back(std::move(record));
    }
    if (nl == std::string_view::npos) {
      break;
    }
    output.remove_prefix(nl + 1);
  }
  return records;
}

DeviceMetadata MetadataFromRecord(const LsblkRecord& record) {
  DeviceMetadata meta;
  meta.name = Field(record, "NAME");
  meta.model = Field(record, "MODEL");
  meta.serial = Field(record, "SERIAL");
  meta.size = Field(record, "SIZE");
  meta.vendor = Field(record, "VENDOR");
  meta.uuid = Field(record, "UUID");
  meta.type = Field(record, "TYPE");
  meta.mountpoint = Field(record, "MOUNTPOINT");
  return meta;
}

std::string FormatDiskEntry(const DiskEntry& entry) {
  return entry.path + " (" + entry.size + ")";
}

LsblkInventory::LsblkInventory(std::string lsblk_tool) : lsblk_tool_(std::move(lsblk_tool)) {}

std::string LsblkInventory::Query(const std::vector<std::string>& argv) {
  auto result = platform::RunAndCapture(argv);
  if (result.exit_code != 0) {
    throw Error{ErrorDomain::IO, errors::io::kSpawnFailed,
                lsblk_tool_ + " exited with status " + std::to_string(result.exit_code)};
  }
  return std::move(result.output);
}

DeviceMetadata LsblkInventory::Describe(const std::filesystem::path& device) {
  const auto output =
      Query({lsblk_tool_, "-dnP", "-o", kDescribeColumns, device.string()});
  const auto records = ParseLsblkPairs(output);
  if (records.empty()) {
    return {};
  }
  return MetadataFromRecord(records.front());
}

std::vector<DiskEntry> UnmountedDisks(const std::vector<LsblkRecord>& records) {
  // A device is busy when it or anything stacked on it (partition, LVM, crypt)
  // is mounted. Devices with several parents appear once per parent.
  std::set<std::string> busy;
  for (const auto& record : records) {
    if (!Field(record, "MOUNTPOINT").empty()) {
      busy.insert(Field(record, "NAME"));
    }
  }
  bool grew = true;
  while (grew) {
    grew = false;
    for (const auto& record : records) {
      const auto parent = Field(record, "PKNAME");
      if (!parent.empty() && busy.count(Field(record, "NAME")) != 0 &&
          busy.insert(parent).second) {
        grew = true;
      }
    }
  }

  std::vector<DiskEntry> disks;
  std::set<std::string> seen;
  for (const auto& record : records) {
    const auto meta = MetadataFromRecord(record);
    if (meta.type != "disk" || meta.name.empty() || busy.count(meta.name) != 0 ||
        !seen.insert(meta.name).second) {
      continue;
    }
    disks.push_back(DiskEntry{meta.name, meta.size});
  }
  return disks;
}

std::vector<DiskEntry> LsblkInventory::ListUnmountedDisks() {
  return UnmountedDisks(ParseLsblkPairs(Query({lsblk_tool_, "-pnP", "-o", kListColumns})));
}

}  // namespace fdup::storage
