#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

#include "fdup/pipeline/stream.h"

namespace fdup::pipeline {

// Returns true when the transfer must stop (e.g. a termination signal arrived).
using InterruptCheck = std::function<bool()>;

// Moves every byte of |source| into |sink| in |block_size| reads, then
// finishes the sink. |interrupted| is polled before each read; a positive
// answer throws fdup::Error (State, kInterrupted) without finishing the sink.
// Returns the number of bytes moved.
uint64_t Relay(ByteSource& source, ByteSink& sink, size_t block_size,
               const InterruptCheck& interrupted = {});

}  // namespace fdup::pipeline
