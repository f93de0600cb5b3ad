#pragma once

#include <cstdint>
#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <diffdb/encode.hpp>

namespace diffdb::log {

struct hex_tag
{};

/**
 * Binary identities are arbitrary bytes, log them as hex.
 */
using hex = quill::BinaryData< hex_tag >;

struct fingerprint
{
  std::uint64_t value = 0;
};

} // namespace diffdb::log

template<>
struct fmtquill::formatter< diffdb::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const diffdb::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                diffdb::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< diffdb::log::hex >: quill::BinaryDataDeferredFormatCodec< diffdb::log::hex >
{};

template<>
struct fmtquill::formatter< diffdb::log::fingerprint >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const diffdb::log::fingerprint& fp, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{:016x}", fp.value );
  }
};

template<>
struct quill::Codec< diffdb::log::fingerprint >: quill::DeferredFormatCodec< diffdb::log::fingerprint >
{};
