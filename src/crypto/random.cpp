#include "fdup/crypto/random.h"

#include <cerrno>
#include <cstddef>

#include <sys/random.h>
#include <unistd.h>

#include "fdup/error.h"

namespace fdup::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw Error(ErrorDomain::Crypto, errno, "getrandom failed", errno);
    }
    offset += static_cast<size_t>(result);
  }
}

}  // namespace fdup::crypto
