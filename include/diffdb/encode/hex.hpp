#pragma once

#include <span>
#include <string>

namespace diffdb::encode {

/**
 * Hex encode a byte string. Identities and fingerprints are printed this way
 * in logs and by the maintenance tool.
 */
std::string to_hex( std::span< const std::byte > s, bool prefix = true ) noexcept;

} // namespace diffdb::encode
