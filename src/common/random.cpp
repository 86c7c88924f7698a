#include "execbox/common/random.hpp"

#include <iomanip>
#include <openssl/rand.h>
#include <random>
#include <sstream>
#include <vector>

namespace execbox::common {

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    // RAND_bytes only fails when the pool cannot be seeded.
    std::random_device device;
    for (auto &byte : data) {
      byte = static_cast<unsigned char>(device() & 0xFFU);
    }
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

} // namespace execbox::common
