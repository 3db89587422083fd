#pragma once

#include <snap_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace snap_mcp {

// Thin wrappers over mbedtls_base64_*. Standard alphabet (RFC 4648), '='
// padding required.
std::string Base64Encode(const std::vector<uint8_t>& data);

// Rejects characters outside the alphabet, bad padding, embedded whitespace
// and lengths that are not a multiple of 4.
Result<std::vector<uint8_t>, std::string> Base64Decode(std::string_view text);

} // namespace snap_mcp
