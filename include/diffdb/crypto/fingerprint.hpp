#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include <boost/endian/conversion.hpp>
#include <boost/mpl/bool.hpp>
#include <boost/serialization/nvp.hpp>

#include <blake3.h>

#include <diffdb/crypto/error.hpp>

namespace diffdb::crypto {

using digest = std::uint64_t;

constexpr std::size_t digest_size = sizeof( digest );

using digest_bytes = std::array< std::byte, digest_size >;

/**
 * Incremental BLAKE3 state truncated to a 64 bit digest.
 *
 * Integers are fed little-endian regardless of the host byte order so a
 * digest computed on one machine matches the digest persisted by another.
 */
class hasher final
{
public:
  hasher() noexcept;

  void update( const void* ptr, std::size_t len ) noexcept;

  template< typename T >
    requires( std::is_integral_v< T > && !std::is_same_v< T, bool > )
  void update( T t ) noexcept
  {
    boost::endian::native_to_little_inplace( t );
    update( &t, sizeof( T ) );
  }

  digest finalize() const noexcept;

private:
  blake3_hasher _hasher{};
};

namespace detail {

namespace tag {

constexpr std::uint8_t boolean              = 0x01;
constexpr std::uint8_t signed_integer       = 0x02;
constexpr std::uint8_t unsigned_integer     = 0x03;
constexpr std::uint8_t floating_point       = 0x04;
constexpr std::uint8_t enumeration          = 0x05;
constexpr std::uint8_t character_string     = 0x06;
constexpr std::uint8_t byte_string          = 0x07;
constexpr std::uint8_t sequence             = 0x08;
constexpr std::uint8_t unordered_collection = 0x09;
constexpr std::uint8_t pair                 = 0x0a;
constexpr std::uint8_t object               = 0x0b;

} // namespace tag

template< typename T >
void append( hasher& h, const T& value );

} // namespace detail

/**
 * A saving archive that feeds every member visited by a Boost.Serialization
 * serialize() member into a hasher. This lets any type the codec can encode
 * through a serialize() member be fingerprinted by the same member list.
 */
class fingerprint_archive final
{
public:
  using is_saving  = boost::mpl::true_;
  using is_loading = boost::mpl::false_;

  explicit fingerprint_archive( hasher& h ) noexcept:
      _hasher( h )
  {}

  template< typename T >
  fingerprint_archive& operator<<( const T& t )
  {
    detail::append( _hasher, t );
    return *this;
  }

  template< typename T >
  fingerprint_archive& operator<<( const boost::serialization::nvp< T >& t )
  {
    detail::append( _hasher, t.const_value() );
    return *this;
  }

  template< typename T >
  fingerprint_archive& operator&( const T& t )
  {
    return *this << t;
  }

private:
  hasher& _hasher;
};

namespace detail {

template< typename T >
struct is_pair: std::false_type
{};

template< typename A, typename B >
struct is_pair< std::pair< A, B > >: std::true_type
{};

template< typename T >
concept string_like = std::is_convertible_v< const T&, std::string_view >;

template< typename T >
concept byte_range = std::ranges::contiguous_range< T >
                     && std::is_same_v< std::remove_cv_t< std::ranges::range_value_t< T > >, std::byte >;

template< typename T >
concept unordered_range = std::ranges::range< T > && requires {
  typename T::hasher;
  typename T::key_equal;
};

template< typename T >
concept serializable_member = requires( T& t, fingerprint_archive& ar ) { t.serialize( ar, 0u ); };

template< typename T >
consteval bool supported()
{
  using U = std::remove_cvref_t< T >;

  if constexpr( std::is_same_v< U, bool > || std::is_integral_v< U > || std::is_enum_v< U > )
    return true;
  else if constexpr( std::is_floating_point_v< U > )
    return sizeof( U ) == sizeof( std::uint32_t ) || sizeof( U ) == sizeof( std::uint64_t );
  else if constexpr( string_like< U > )
    return true;
  else if constexpr( is_pair< U >::value )
    return supported< typename U::first_type >() && supported< typename U::second_type >();
  else if constexpr( std::ranges::range< U > )
    return supported< std::ranges::range_value_t< U > >();
  else if constexpr( std::is_pointer_v< U > )
    return false;
  else
    return serializable_member< U >;
}

template< typename T >
void append( hasher& h, const T& value )
{
  using U = std::remove_cvref_t< T >;
  static_assert( supported< U >(), "type cannot be fingerprinted" );

  if constexpr( std::is_same_v< U, bool > )
  {
    h.update( tag::boolean );
    h.update( static_cast< std::uint8_t >( value ? 1 : 0 ) );
  }
  else if constexpr( std::is_enum_v< U > )
  {
    h.update( tag::enumeration );
    h.update( static_cast< std::uint8_t >( sizeof( U ) ) );
    h.update( static_cast< std::underlying_type_t< U > >( value ) );
  }
  else if constexpr( std::is_integral_v< U > )
  {
    h.update( std::is_signed_v< U > ? tag::signed_integer : tag::unsigned_integer );
    h.update( static_cast< std::uint8_t >( sizeof( U ) ) );
    h.update( value );
  }
  else if constexpr( std::is_floating_point_v< U > )
  {
    h.update( tag::floating_point );
    h.update( static_cast< std::uint8_t >( sizeof( U ) ) );
    if constexpr( sizeof( U ) == sizeof( std::uint32_t ) )
      h.update( std::bit_cast< std::uint32_t >( value ) );
    else
      h.update( std::bit_cast< std::uint64_t >( value ) );
  }
  else if constexpr( string_like< U > )
  {
    std::string_view sv( value );
    h.update( tag::character_string );
    h.update( static_cast< std::uint64_t >( sv.size() ) );
    h.update( sv.data(), sv.size() );
  }
  else if constexpr( is_pair< U >::value )
  {
    h.update( tag::pair );
    append( h, value.first );
    append( h, value.second );
  }
  else if constexpr( unordered_range< U > )
  {
    // Element digests are summed so the result does not depend on bucket order
    digest sum         = 0;
    std::uint64_t size = 0;
    for( const auto& element: value )
    {
      hasher element_hasher;
      append( element_hasher, element );
      sum += element_hasher.finalize();
      ++size;
    }

    h.update( tag::unordered_collection );
    h.update( size );
    h.update( sum );
  }
  else if constexpr( byte_range< U > )
  {
    h.update( tag::byte_string );
    h.update( static_cast< std::uint64_t >( std::ranges::size( value ) ) );
    h.update( std::ranges::data( value ), std::ranges::size( value ) );
  }
  else if constexpr( std::ranges::range< U > )
  {
    h.update( tag::sequence );
    h.update( static_cast< std::uint64_t >( std::ranges::distance( value ) ) );
    for( const auto& element: value )
      append( h, element );
  }
  else
  {
    h.update( tag::object );
    fingerprint_archive ar( h );
    const_cast< U& >( value ).serialize( ar, 0u ); // NOLINT(cppcoreguidelines-pro-type-const-cast)
  }
}

} // namespace detail

/**
 * Any value built from scalars, strings, byte strings, ordered sequences,
 * ordered and unordered collections, pairs and types with a
 * Boost.Serialization serialize() member.
 */
template< typename T >
concept Fingerprintable = detail::supported< T >();

/**
 * Structural 64 bit fingerprint of a value.
 *
 * Equal values produce equal fingerprints across runs and hosts. Unordered
 * collections are insensitive to iteration order, ordered sequences are not.
 */
template< Fingerprintable T >
digest fingerprint( const T& value )
{
  hasher h;
  detail::append( h, value );
  return h.finalize();
}

/**
 * The stored form of a fingerprint, 8 bytes little-endian.
 */
digest_bytes to_bytes( digest d ) noexcept;
result< digest > from_bytes( std::span< const std::byte > s ) noexcept;

} // namespace diffdb::crypto
