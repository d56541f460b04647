#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace fdup::pipeline {

// Pull side of a transfer: a device or any other sequential byte producer.
class ByteSource {
 public:
  virtual ~ByteSource() = default;
  // Reads up to out.size() bytes. Returns 0 only at end of stream. Throws
  // fdup::Error on read failure.
  virtual size_t Read(std::span<uint8_t> out) = 0;
};

// Push side of a transfer. Stages wrap the next stage and forward transformed
// bytes; Finish() flushes and completes the whole downstream chain.
class ByteSink {
 public:
  virtual ~ByteSink() = default;
  virtual void Write(std::span<const uint8_t> data) = 0;
  virtual void Finish() = 0;
};

class MemorySource final : public ByteSource {
 public:
  explicit MemorySource(std::vector<uint8_t> data) : data_(std::move(data)) {}

  size_t Read(std::span<uint8_t> out) override;

  [[nodiscard]] size_t position() const noexcept { return position_; }

 private:
  std::vector<uint8_t> data_;
  size_t position_{0};
};

class MemorySink final : public ByteSink {
 public:
  void Write(std::span<const uint8_t> data) override;
  void Finish() override;

  [[nodiscard]] const std::vector<uint8_t>& data() const noexcept { return data_; }
  [[nodiscard]] bool finished() const noexcept { return finished_; }

 private:
  std::vector<uint8_t> data_;
  bool finished_{false};
};

}  // namespace fdup::pipeline
