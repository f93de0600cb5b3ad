#pragma once

#include <cstddef>
#include <exception>
#include <istream>
#include <ranges>
#include <span>
#include <sstream>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/serialization/array.hpp>
#include <boost/serialization/deque.hpp>
#include <boost/serialization/list.hpp>
#include <boost/serialization/map.hpp>
#include <boost/serialization/set.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/unordered_map.hpp>
#include <boost/serialization/unordered_set.hpp>
#include <boost/serialization/utility.hpp>
#include <boost/serialization/vector.hpp>

#include <diffdb/codec/error.hpp>
#include <diffdb/memory.hpp>

namespace diffdb::codec {

namespace detail {

void report_failure( std::string_view operation, const std::exception& e ) noexcept;

template< typename T >
struct is_pair: std::false_type
{};

template< typename A, typename B >
struct is_pair< std::pair< A, B > >: std::true_type
{};

template< typename T >
consteval bool owns_content()
{
  using U = std::remove_cvref_t< T >;

  if constexpr( std::is_pointer_v< U > || std::ranges::view< U > )
    return false;
  else if constexpr( is_pair< U >::value )
    return owns_content< typename U::first_type >() && owns_content< typename U::second_type >();
  else if constexpr( std::ranges::range< U > )
    return owns_content< std::ranges::range_value_t< U > >();
  else
    return true;
}

} // namespace detail

/**
 * A value the codec can store by content. Pointers and views, at any depth,
 * refer to memory a decoder cannot rebuild and are rejected.
 */
template< typename T >
concept Encodable = detail::owns_content< T >();

/**
 * Serialize a value with a Boost binary archive.
 *
 * Object tracking is disabled, values are stored by content.
 */
template< Encodable T >
result< std::vector< std::byte > > encode( const T& value )
{
  std::stringstream ss;

  try
  {
    boost::archive::binary_oarchive oa( ss, boost::archive::no_tracking );
    oa << value;
  }
  catch( const std::exception& e )
  {
    detail::report_failure( "encode", e );
    return std::unexpected( codec_errc::encode_failure );
  }

  const auto serialized = ss.str();
  const auto bytes      = std::as_bytes( std::span( serialized ) );
  return std::vector< std::byte >( bytes.begin(), bytes.end() );
}

/**
 * Deserialize bytes produced by encode() into target.
 *
 * The target must have the shape of the encoded value. A mismatch is not
 * detected up front; it surfaces as decode_failure when the archive cannot be
 * read.
 */
template< typename T >
std::error_code decode( std::span< const std::byte > data, T& target )
{
  try
  {
    boost::interprocess::ibufferstream is( memory::pointer_cast< const char* >( data.data() ), data.size() );
    std::istream& in = is;
    boost::archive::binary_iarchive ia( in, boost::archive::no_tracking );
    ia >> target;
  }
  catch( const std::exception& e )
  {
    detail::report_failure( "decode", e );
    return codec_errc::decode_failure;
  }

  return {};
}

/**
 * Decodes the payload of a single pending change. A decoder is only valid
 * for the duration of the apply callback it is handed to.
 */
class decoder final
{
public:
  explicit decoder( std::span< const std::byte > data ) noexcept;

  template< typename T >
  std::error_code decode( T& target ) const
  {
    return codec::decode( _data, target );
  }

  std::span< const std::byte > data() const noexcept;

private:
  std::span< const std::byte > _data;
};

} // namespace diffdb::codec
