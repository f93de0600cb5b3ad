#include <diffdb/encode/hex.hpp>

#include <bit>
#include <iomanip>
#include <sstream>

namespace diffdb::encode {

std::string to_hex( std::span< const std::byte > s, bool prefix ) noexcept
{
  std::stringstream stream;
  if( prefix )
    stream << "0x";

  stream << std::hex << std::setfill( '0' );
  for( const auto& b: s )
    stream << std::setw( 2 ) << static_cast< unsigned int >( std::bit_cast< unsigned char >( b ) );

  return stream.str();
}

} // namespace diffdb::encode
