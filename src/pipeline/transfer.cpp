#include "fdup/pipeline/transfer.h"

#include <string>
#include <vector>

#include "fdup/error.h"
#include "fdup/errors.h"

namespace fdup::pipeline {

uint64_t Relay(ByteSource& source, ByteSink& sink, size_t block_size,
               const InterruptCheck& interrupted) {
  if (block_size == 0) {
    throw Error{ErrorDomain::Validation, errors::validation::kBadArgument,
                "block size must be positive"};
  }
  std::vector<uint8_t> buffer(block_size);
  uint64_t total = 0;
  while (true) {
    if (interrupted && interrupted()) {
      throw Error{ErrorDomain::State, errors::state::kInterrupted,
                  std::string(errors::msg::kInterruptedBySignal)};
    }
    const size_t got = source.Read(std::span<uint8_t>(buffer.data(), buffer.size()));
    if (got == 0) {
      break;
    }
    sink.Write(std::span<const uint8_t>(buffer.data(), got));
    total += got;
  }
  sink.Finish();
  return total;
}

}  // namespace fdup::pipeline
