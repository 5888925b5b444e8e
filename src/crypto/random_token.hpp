#pragma once

#include <string>

namespace masterlist::crypto {

// RFC 4122 version 4 UUID from the OpenSSL CSPRNG. Throws std::runtime_error if
// the generator is unavailable.
std::string GenerateUuidV4();

} // namespace masterlist::crypto
