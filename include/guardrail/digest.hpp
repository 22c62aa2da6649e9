#pragma once

#include <string>
#include <string_view>

namespace guardrail {

// Lower-case hex SHA-256 of the given bytes. Throws std::runtime_error if
// the EVP backend fails.
std::string sha256_hex(std::string_view data);

} // namespace guardrail
