#include <diffdb/crypto/fingerprint.hpp>
#include <diffdb/memory.hpp>

#include <cstring>

namespace diffdb::crypto {

hasher::hasher() noexcept
{
  blake3_hasher_init( &_hasher );
}

void hasher::update( const void* ptr, std::size_t len ) noexcept
{
  blake3_hasher_update( &_hasher, ptr, len );
}

digest hasher::finalize() const noexcept
{
  digest_bytes out;
  blake3_hasher_finalize( &_hasher, memory::pointer_cast< std::uint8_t* >( out.data() ), out.size() );

  digest d = 0;
  std::memcpy( &d, out.data(), sizeof( d ) );
  boost::endian::little_to_native_inplace( d );
  return d;
}

digest_bytes to_bytes( digest d ) noexcept
{
  boost::endian::native_to_little_inplace( d );

  digest_bytes out;
  std::memcpy( out.data(), &d, sizeof( d ) );
  return out;
}

result< digest > from_bytes( std::span< const std::byte > s ) noexcept
{
  if( s.size() != digest_size )
    return std::unexpected( crypto_errc::invalid_fingerprint );

  auto d = memory::bit_cast< digest >( s );
  boost::endian::little_to_native_inplace( d );
  return d;
}

} // namespace diffdb::crypto
