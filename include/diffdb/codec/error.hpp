#pragma once

#include <expected>
#include <system_error>

namespace diffdb::codec {

enum class codec_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  encode_failure,
  decode_failure
};

const std::error_category& codec_category() noexcept;

std::error_code make_error_code( codec_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace diffdb::codec

template<>
struct std::is_error_code_enum< diffdb::codec::codec_errc >: public std::true_type
{};
