#pragma once

#include <cstddef>
#include <string>

namespace execbox::common {

/// Lowercase hex string of `bytes` random bytes drawn from OpenSSL's CSPRNG.
[[nodiscard]] std::string random_hex(std::size_t bytes);

} // namespace execbox::common
