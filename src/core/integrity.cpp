#include "fdup/core/integrity.h"

#include "fdup/common.h"
#include "fdup/error.h"

namespace fdup::core {

void DigestSink::Write(std::span<const uint8_t> data) {
  if (finished_) {
    throw Error{ErrorDomain::State, errors::state::kStageFinished, "digest already finalized"};
  }
  stream_.Update(data);
  digest_.bytes += data.size();
}

void DigestSink::Finish() {
  if (finished_) {
    return;
  }
  const auto hash = stream_.Final();
  digest_.hex = HexEncode(std::span<const uint8_t>(hash.data(), hash.size()));
  finished_ = true;
}

IntegrityDigest ComputeDigest(pipeline::ByteSource& source, size_t block_size,
                              const pipeline::InterruptCheck& interrupted) {
  DigestSink sink;
  pipeline::Relay(source, sink, block_size, interrupted);
  return sink.digest();
}

}  // namespace fdup::core
