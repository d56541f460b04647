#include "fdup/common.h"
#include "fdup/core/integrity.h"
#include "fdup/crypto/sha256.h"
#include "fdup/error.h"
#include "fdup/pipeline/stream.h"
#include "fdup/storage/block_device.h"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <span>
#include <vector>

namespace {

std::vector<uint8_t> Pattern(size_t size, uint8_t seed) {
  std::vector<uint8_t> data(size);
  for (size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>(i * 7u + seed);
  }
  return data;
}

std::filesystem::path WriteImage(const std::vector<uint8_t>& data) {
  auto path = std::filesystem::temp_directory_path() / "fdup_integrity_image.bin";
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  return path;
}

void TestDigestIsDeterministic() {
  const auto data = Pattern(3 * 1024 * 1024 + 17, 3);
  fdup::pipeline::MemorySource first(data);
  fdup::pipeline::MemorySource second(data);
  const auto a = fdup::core::ComputeDigest(first, 4 * fdup::kMiB);
  const auto b = fdup::core::ComputeDigest(second, 65536);
  assert(a == b);
  assert(a.bytes == data.size());
  assert(a.hex.size() == 64);
  assert(a.hex == fdup::HexEncode(fdup::crypto::SHA256_Hash(data)));
}

void TestDigestDetectsChange() {
  auto data = Pattern(100000, 9);
  fdup::pipeline::MemorySource before(data);
  const auto a = fdup::core::ComputeDigest(before, 4096);
  data[50000] ^= 0x01;
  fdup::pipeline::MemorySource after(data);
  const auto b = fdup::core::ComputeDigest(after, 4096);
  assert(a.bytes == b.bytes);
  assert(a.hex != b.hex);
  assert(!(a == b));
}

void TestEmptySource() {
  fdup::pipeline::MemorySource empty(std::vector<uint8_t>{});
  const auto digest = fdup::core::ComputeDigest(empty, 4096);
  assert(digest.bytes == 0);
  assert(digest.hex == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

void TestDeviceReaderOverFile() {
  const auto data = Pattern(1000003, 1);
  const auto path = WriteImage(data);
  assert(!fdup::storage::IsBlockDevice(path));

  fdup::storage::SystemDeviceOpener opener;
  uint64_t size = 0;
  auto source = opener.Open(path, &size);
  assert(size == data.size());
  const auto digest = fdup::core::ComputeDigest(*source, 4096);
  assert(digest.bytes == data.size());
  assert(digest.hex == fdup::HexEncode(fdup::crypto::SHA256_Hash(data)));

  fdup::storage::DeviceReader reader(path);
  std::vector<uint8_t> buffer(4096);
  const auto got = reader.Read(std::span<uint8_t>(buffer.data(), buffer.size()));
  assert(got > 0 && got <= buffer.size());
  assert(reader.position() == got);
  std::filesystem::remove(path);
}

void TestDeviceReaderErrors() {
  bool threw = false;
  try {
    fdup::storage::DeviceReader reader("/nonexistent/fdup-device");
  } catch (const fdup::Error& err) {
    threw = err.code == fdup::errors::io::kDeviceOpenFailed && err.native_code.has_value();
  }
  assert(threw);

  threw = false;
  try {
    fdup::storage::DeviceReader reader("/dev/null");
  } catch (const fdup::Error& err) {
    threw = err.code == fdup::errors::validation::kNotBlockDevice;
  }
  assert(threw);
  assert(!fdup::storage::IsBlockDevice("/dev/null"));
}

}  // namespace

int main() {
  TestDigestIsDeterministic();
  TestDigestDetectsChange();
  TestEmptySource();
  TestDeviceReaderOverFile();
  TestDeviceReaderErrors();
  std::cout << "integrity tests ok\n";
  return 0;
}
