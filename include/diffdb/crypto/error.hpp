#pragma once

#include <expected>
#include <system_error>

namespace diffdb::crypto {

enum class crypto_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_fingerprint
};

const std::error_category& crypto_category() noexcept;

std::error_code make_error_code( crypto_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace diffdb::crypto

template<>
struct std::is_error_code_enum< diffdb::crypto::crypto_errc >: public std::true_type
{};
