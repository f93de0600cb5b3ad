#include <diffdb/storage/region.hpp>

#include <diffdb/memory.hpp>
#include <diffdb/storage/error.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>

namespace diffdb::storage {

namespace {

constexpr std::byte catalog_tag{ 0x00 };
constexpr std::byte data_tag{ 0x01 };
constexpr std::byte segment_tag{ 0x01 };
constexpr std::byte terminator{ 0x00 };

void append_segment( std::vector< std::byte >& key, const std::string& segment )
{
  if( segment.size() > std::numeric_limits< std::uint32_t >::max() )
    throw storage_error( storage_errc::backend_failure, "region name is too long" );

  key.push_back( segment_tag );

  auto length = boost::endian::native_to_big( static_cast< std::uint32_t >( segment.size() ) );
  auto bytes  = memory::as_bytes( &length, 1 );
  key.insert( key.end(), bytes.begin(), bytes.end() );

  auto name = memory::as_bytes( segment );
  key.insert( key.end(), name.begin(), name.end() );
}

std::vector< std::byte > encode_path( std::byte tag, const std::vector< std::string >& path )
{
  std::vector< std::byte > key{ tag };
  for( const auto& segment: path )
    append_segment( key, segment );

  return key;
}

} // namespace

region::region( std::string_view name ):
    _path{ std::string( name ) }
{}

region region::child( std::string_view name ) const
{
  region r;
  r._path = _path;
  r._path.emplace_back( name );
  return r;
}

std::optional< region > region::parent() const
{
  if( _path.size() < 2 )
    return {};

  region r;
  r._path.assign( _path.begin(), _path.end() - 1 );
  return r;
}

const std::vector< std::string >& region::path() const noexcept
{
  return _path;
}

const std::string& region::name() const noexcept
{
  return _path.back();
}

std::string region::to_string() const
{
  std::string s;
  for( const auto& segment: _path )
  {
    if( !s.empty() )
      s += '/';

    s += segment;
  }

  return s;
}

std::vector< std::byte > region::prefix() const
{
  auto key = subtree_prefix();
  key.push_back( terminator );
  return key;
}

std::vector< std::byte > region::subtree_prefix() const
{
  return encode_path( data_tag, _path );
}

std::vector< std::byte > region::catalog_subtree_prefix() const
{
  return encode_path( catalog_tag, _path );
}

std::vector< std::byte > region::make_key( std::span< const std::byte > key ) const
{
  auto full_key = prefix();
  full_key.insert( full_key.end(), key.begin(), key.end() );
  return full_key;
}

std::vector< std::byte > region::catalog_key() const
{
  auto key = catalog_subtree_prefix();
  key.push_back( terminator );
  return key;
}

std::vector< std::byte > region::catalog_prefix()
{
  return { catalog_tag };
}

std::optional< region > region::from_catalog_key( std::span< const std::byte > key )
{
  if( key.size() < 2 || key.front() != catalog_tag || key.back() != terminator )
    return {};

  region r;
  std::size_t pos = 1;

  while( pos < key.size() - 1 )
  {
    if( key[ pos ] != segment_tag || key.size() - pos < 2 + sizeof( std::uint32_t ) )
      return {};

    auto length = boost::endian::big_to_native( memory::bit_cast< std::uint32_t >( key.subspan( pos + 1 ) ) );
    pos += 1 + sizeof( std::uint32_t );

    if( key.size() - 1 - pos < length )
      return {};

    r._path.emplace_back( memory::as_string_view( key.subspan( pos, length ) ) );
    pos += length;
  }

  if( r._path.empty() )
    return {};

  return r;
}

} // namespace diffdb::storage
