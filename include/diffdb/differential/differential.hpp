#pragma once

#include <diffdb/codec.hpp>
#include <diffdb/crypto.hpp>
#include <diffdb/differential/error.hpp>
#include <diffdb/memory.hpp>
#include <diffdb/storage/bucket.hpp>
#include <diffdb/storage/database.hpp>
#include <diffdb/storage/region.hpp>

#include <atomic>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace diffdb {

namespace region_name {

constexpr std::string_view committed = "_m";
constexpr std::string_view pending   = "_ph";
constexpr std::string_view payloads  = "_pd";
constexpr std::string_view user_data = "_ud";
constexpr std::string_view conflicts = "_dk";

} // namespace region_name

/**
 * A value that can be staged: it is fingerprinted and its content is stored
 * as the pending payload.
 */
template< typename T >
concept Trackable = crypto::Fingerprintable< T > && codec::Encodable< T >;

template< typename T >
concept StringIdentifiable = requires( const T& t ) {
  { t.id() } -> std::convertible_to< std::string_view >;
};

template< typename T >
concept BytesIdentifiable = requires( const T& t ) {
  { t.id() } -> std::convertible_to< std::span< const std::byte > >;
};

/**
 * Tracks changes to a collection of items addressed by caller chosen
 * identities.
 *
 * Each identity has at most one committed fingerprint (the value last
 * applied) and at most one pending fingerprint with its encoded payload (an
 * observed change that has not been applied yet). add() stages changes,
 * each() delivers them and promotes those that apply cleanly.
 *
 * Every operation runs in its own storage transaction. Store failures are
 * returned as error codes.
 */
class differential final
{
public:
  using apply_function =
    std::function< std::error_code( std::span< const std::byte > id, const codec::decoder& data ) >;
  using view_function   = std::function< std::error_code( const storage::bucket& ) >;
  using update_function = std::function< std::error_code( storage::bucket& ) >;

  differential( std::shared_ptr< storage::database > db, std::string name );
  differential( const differential& )            = delete;
  differential( differential&& )                 = delete;
  differential& operator=( const differential& ) = delete;
  differential& operator=( differential&& )      = delete;
  ~differential();

  const std::string& name() const noexcept;

  /**
   * Stages value as the latest observation for id.
   *
   * Returns false when the value matches the committed or pending
   * fingerprint and nothing was written. When conflict tracking is active a
   * second add for the same identity in one cycle fails with
   * conflicting_identity and leaves the stored state untouched.
   */
  template< Trackable T >
  result< bool > add( std::span< const std::byte > id, const T& value )
  {
    return stage( id,
                  crypto::fingerprint( value ),
                  [ &value ]()
                  {
                    return codec::encode( value );
                  } );
  }

  template< Trackable T >
  result< bool > add( std::string_view id, const T& value )
  {
    return add( memory::as_bytes( id ), value );
  }

  template< Trackable T >
    requires StringIdentifiable< T >
  result< bool > add( const T& object )
  {
    return add( std::string_view( object.id() ), object );
  }

  template< Trackable T >
    requires( BytesIdentifiable< T > && !StringIdentifiable< T > )
  result< bool > add( const T& object )
  {
    return add( std::span< const std::byte >( object.id() ), object );
  }

  /**
   * True when id has never been applied or was applied with a different
   * value. Pending changes are not considered.
   */
  template< crypto::Fingerprintable T >
  result< bool > changed( std::span< const std::byte > id, const T& value ) const
  {
    return compare( id, crypto::fingerprint( value ) );
  }

  template< crypto::Fingerprintable T >
  result< bool > changed( std::string_view id, const T& value ) const
  {
    return changed( memory::as_bytes( id ), value );
  }

  result< std::uint64_t > count_tracking() const;
  result< std::uint64_t > count_changes() const;

  /**
   * Identities with a pending change, in ascending order.
   */
  result< std::vector< std::vector< std::byte > > > pending() const;

  /**
   * Clears every conflict marker and starts a new cycle. Enforcement begins
   * once the reset has been committed.
   */
  std::error_code reset_conflict_tracking();
  bool tracking_conflicts() const noexcept;

  /**
   * Delivers every pending change, in ascending identity order, to fn.
   *
   * Changes fn accepts are committed, rejected ones stay pending. stop is
   * polled before each change. Work completed before a stop request or an
   * item failure is kept.
   */
  apply_result each( std::stop_token stop, const apply_function& fn );
  apply_result each( const apply_function& fn );

  /**
   * Runs fn against the user data region. update_user_data() commits only
   * if fn returns no error.
   */
  std::error_code view_user_data( const view_function& fn ) const;
  std::error_code update_user_data( const update_function& fn );

private:
  using encode_function = std::function< result< std::vector< std::byte > >() >;

  result< bool > stage( std::span< const std::byte > id, crypto::digest fingerprint, const encode_function& encode );
  result< bool > compare( std::span< const std::byte > id, crypto::digest fingerprint ) const;

  std::shared_ptr< storage::database > _db;
  std::string _name;

  storage::region _root;
  storage::region _committed;
  storage::region _pending;
  storage::region _payloads;
  storage::region _user_data;
  storage::region _conflicts;

  std::atomic< bool > _track_conflicts = false;
};

} // namespace diffdb
