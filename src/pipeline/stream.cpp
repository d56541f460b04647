#include "fdup/pipeline/stream.h"

#include <algorithm>

#include "fdup/error.h"

namespace fdup::pipeline {

size_t MemorySource::Read(std::span<uint8_t> out) {
  const size_t remaining = data_.size() - position_;
  const size_t take = std::min(remaining, out.size());
  std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), take, out.begin());
  position_ += take;
  return take;
}

void MemorySink::Write(std::span<const uint8_t> data) {
  if (finished_) {
    throw Error{ErrorDomain::State, errors::state::kStageFinished, "write after finish"};
  }
  data_.insert(data_.end(), data.begin(), data.end());
}

void MemorySink::Finish() {
  finished_ = true;
}

}  // namespace fdup::pipeline
