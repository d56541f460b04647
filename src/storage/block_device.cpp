#include "fdup/storage/block_device.h"

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "fdup/common.h"
#include "fdup/error.h"
#include "fdup/errors.h"

namespace fdup::storage {

namespace {

[[noreturn]] void ThrowIo(int code, const std::string& what, const std::filesystem::path& path,
                          int err) {
  throw Error{ErrorDomain::IO, code,
              what + " " + PathToUtf8String(path) + ": " + std::strerror(err), err};
}

}  // namespace

bool IsBlockDevice(const std::filesystem::path& path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISBLK(st.st_mode);
}

DeviceReader::DeviceReader(const std::filesystem::path& path) : path_(path) {
  fd_.reset(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd_) {
    ThrowIo(errors::io::kDeviceOpenFailed, "cannot open", path, errno);
  }
  struct stat st {};
  if (::fstat(fd_.get(), &st) != 0) {
    ThrowIo(errors::io::kDeviceOpenFailed, "cannot stat", path, errno);
  }
  if (S_ISBLK(st.st_mode)) {
    uint64_t bytes = 0;
    if (::ioctl(fd_.get(), BLKGETSIZE64, &bytes) != 0) {
      ThrowIo(errors::io::kDeviceOpenFailed, "cannot query size of", path, errno);
    }
    size_ = bytes;
  } else if (S_ISREG(st.st_mode)) {
    size_ = static_cast<uint64_t>(st.st_size);
  } else {
    throw Error{ErrorDomain::Validation, errors::validation::kNotBlockDevice,
                PathToUtf8String(path) + " is not a block device"};
  }
}

size_t DeviceReader::Read(std::span<uint8_t> out) {
  if (out.empty() || position_ >= size_) {
    return 0;
  }
  const uint64_t remaining = size_ - position_;
  const size_t want = remaining < out.size() ? static_cast<size_t>(remaining) : out.size();
  while (true) {
    ssize_t rc = ::read(fd_.get(), out.data(), want);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      ThrowIo(errors::io::kDeviceReadFailed, "read failed on", path_, errno);
    }
    if (rc == 0) {
      throw Error{ErrorDomain::IO, errors::io::kDeviceReadFailed,
                  std::string(errors::msg::kShortDeviceRead) + " (" + PathToUtf8String(path_) +
                      " at byte " + std::to_string(position_) + ")"};
    }
    position_ += static_cast<uint64_t>(rc);
    return static_cast<size_t>(rc);
  }
}

bool SystemDeviceOpener::IsBlockDevice(const std::filesystem::path& path) {
  return storage::IsBlockDevice(path);
}

std::unique_ptr<pipeline::ByteSource> SystemDeviceOpener::Open(const std::filesystem::path& path,
                                                               uint64_t* size_out) {
  auto reader = std::make_unique<DeviceReader>(path);
  if (size_out) {
    *size_out = reader->size();
  }
  return reader;
}

}  // namespace fdup::storage
