// NOLINTBEGIN

#include <gtest/gtest.h>

#include <diffdb/differential.hpp>
#include <diffdb/encode.hpp>
#include <diffdb/memory.hpp>
#include <diffdb/storage/error.hpp>

#include <test/fixture.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct row
{
  std::string key;
  std::int64_t balance = 0;
  std::map< std::string, std::string > attributes;

  const std::string& id() const
  {
    return key;
  }

  template< class Archive >
  void serialize( Archive& ar, const unsigned int version )
  {
    ar & key;
    ar & balance;
    ar & attributes;
  }

  bool operator==( const row& ) const = default;
};

std::string as_string( std::span< const std::byte > id )
{
  return std::string( diffdb::memory::as_string_view( id ) );
}

} // namespace

class differential_test: public ::testing::Test,
                         public test::fixture
{
public:
  differential_test():
      test::fixture( "differential", "info" )
  {
    EXPECT_FALSE( db.open( database_path() ) );

    auto opened = db.open_differential( "test" );
    EXPECT_TRUE( opened );
    if( opened )
      diff = *opened;
  }

  differential_test( const differential_test& ) = delete;
  differential_test( differential_test&& )      = delete;

  ~differential_test() override
  {
    diff.reset();
    db.close();
  }

  differential_test& operator=( const differential_test& ) = delete;
  differential_test& operator=( differential_test&& )      = delete;

  std::uint64_t tracking()
  {
    auto count = diff->count_tracking();
    EXPECT_TRUE( count );
    return count.value_or( 0 );
  }

  std::uint64_t changes()
  {
    auto count = diff->count_changes();
    EXPECT_TRUE( count );
    return count.value_or( 0 );
  }

  diffdb::database db;
  std::shared_ptr< diffdb::differential > diff;
};

TEST_F( differential_test, idempotent_add )
{
  auto first = diff->add( "x", std::int64_t( 1 ) );
  ASSERT_TRUE( first );
  EXPECT_TRUE( *first );

  auto second = diff->add( "x", std::int64_t( 1 ) );
  ASSERT_TRUE( second );
  EXPECT_FALSE( *second );

  EXPECT_EQ( changes(), 1 );
  EXPECT_EQ( tracking(), 0 );
}

TEST_F( differential_test, apply_promotes_state )
{
  ASSERT_TRUE( diff->add( "x", std::int64_t( 1 ) ) );
  EXPECT_EQ( tracking(), 0 );
  EXPECT_EQ( changes(), 1 );

  int calls = 0;
  auto result = diff->each(
    [ & ]( std::span< const std::byte > id, const diffdb::codec::decoder& data ) -> std::error_code
    {
      ++calls;
      EXPECT_EQ( as_string( id ), "x" );

      std::int64_t value = 0;
      EXPECT_FALSE( data.decode( value ) );
      EXPECT_EQ( value, 1 );
      return {};
    } );

  EXPECT_TRUE( result );
  EXPECT_EQ( calls, 1 );
  EXPECT_EQ( tracking(), 1 );
  EXPECT_EQ( changes(), 0 );
}

TEST_F( differential_test, unchanged_value_is_a_nop )
{
  ASSERT_TRUE( diff->add( "x", std::string( "value" ) ) );
  ASSERT_TRUE( diff->each( []( auto, const auto& ) { return std::error_code(); } ) );

  auto added = diff->add( "x", std::string( "value" ) );
  ASSERT_TRUE( added );
  EXPECT_FALSE( *added );
  EXPECT_EQ( changes(), 0 );
  EXPECT_EQ( tracking(), 1 );

  added = diff->add( "x", std::string( "other" ) );
  ASSERT_TRUE( added );
  EXPECT_TRUE( *added );
  EXPECT_EQ( changes(), 1 );
}

TEST_F( differential_test, supersede_pending )
{
  ASSERT_TRUE( diff->add( "x", std::string( "v1" ) ) );
  ASSERT_TRUE( diff->add( "x", std::string( "v2" ) ) );
  EXPECT_EQ( changes(), 1 );

  std::vector< std::string > seen;
  auto result = diff->each(
    [ & ]( std::span< const std::byte >, const diffdb::codec::decoder& data ) -> std::error_code
    {
      std::string value;
      if( auto ec = data.decode( value ); ec )
        return ec;

      seen.push_back( value );
      return {};
    } );

  EXPECT_TRUE( result );
  ASSERT_EQ( seen.size(), 1 );
  EXPECT_EQ( seen[ 0 ], "v2" );
}

TEST_F( differential_test, changed_reflects_committed_state )
{
  auto changed = diff->changed( "x", std::int64_t( 1 ) );
  ASSERT_TRUE( changed );
  EXPECT_TRUE( *changed );

  ASSERT_TRUE( diff->add( "x", std::int64_t( 1 ) ) );

  // Pending changes do not count
  changed = diff->changed( "x", std::int64_t( 1 ) );
  ASSERT_TRUE( changed );
  EXPECT_TRUE( *changed );

  ASSERT_TRUE( diff->each( []( auto, const auto& ) { return std::error_code(); } ) );

  changed = diff->changed( "x", std::int64_t( 1 ) );
  ASSERT_TRUE( changed );
  EXPECT_FALSE( *changed );

  changed = diff->changed( "x", std::int64_t( 2 ) );
  ASSERT_TRUE( changed );
  EXPECT_TRUE( *changed );
}

TEST_F( differential_test, conflict_tracking )
{
  EXPECT_FALSE( diff->tracking_conflicts() );

  // Without tracking repeated adds supersede each other
  ASSERT_TRUE( diff->add( "1", std::string( "a" ) ) );
  ASSERT_TRUE( diff->add( "1", std::string( "b" ) ) );

  EXPECT_FALSE( diff->reset_conflict_tracking() );
  EXPECT_TRUE( diff->tracking_conflicts() );

  ASSERT_TRUE( diff->add( "1", std::string( "x" ) ) );
  ASSERT_TRUE( diff->add( "2", std::string( "y" ) ) );

  auto conflict = diff->add( "1", std::string( "z" ) );
  ASSERT_FALSE( conflict );
  EXPECT_EQ( conflict.error(), diffdb::differential_errc::conflicting_identity );

  std::map< std::string, std::string > pending;
  auto result = diff->each(
    [ & ]( std::span< const std::byte > id, const diffdb::codec::decoder& data ) -> std::error_code
    {
      std::string value;
      if( auto ec = data.decode( value ); ec )
        return ec;

      pending[ as_string( id ) ] = value;
      return {};
    } );

  EXPECT_TRUE( result );
  EXPECT_EQ( pending[ "1" ], "x" );
  EXPECT_EQ( pending[ "2" ], "y" );

  // Markers survive an apply until the next reset
  conflict = diff->add( "1", std::string( "z" ) );
  ASSERT_FALSE( conflict );

  EXPECT_FALSE( diff->reset_conflict_tracking() );
  EXPECT_FALSE( diff->reset_conflict_tracking() );
  EXPECT_TRUE( diff->add( "1", std::string( "z" ) ) );
}

TEST_F( differential_test, partial_apply_with_cancellation )
{
  for( int i = 0; i < 10; ++i )
    ASSERT_TRUE( diff->add( "item" + std::to_string( i ), std::int64_t( i ) ) );

  EXPECT_EQ( changes(), 10 );

  std::stop_source source;
  int processed = 0;

  auto result = diff->each( source.get_token(),
                            [ & ]( std::span< const std::byte >, const diffdb::codec::decoder& ) -> std::error_code
                            {
                              if( ++processed == 4 )
                                source.request_stop();

                              return {};
                            } );

  ASSERT_FALSE( result );
  EXPECT_TRUE( result.error().cancelled() );
  EXPECT_TRUE( result.error().failures().empty() );
  EXPECT_EQ( result.error().code(), diffdb::differential_errc::cancelled );

  EXPECT_EQ( processed, 4 );
  EXPECT_EQ( tracking(), 4 );
  EXPECT_EQ( changes(), 6 );

  // The rest is delivered on the next pass
  EXPECT_TRUE( diff->each( []( auto, const auto& ) { return std::error_code(); } ) );
  EXPECT_EQ( tracking(), 10 );
  EXPECT_EQ( changes(), 0 );
}

TEST_F( differential_test, failure_isolation )
{
  for( int i = 0; i < 5; ++i )
    ASSERT_TRUE( diff->add( std::to_string( i ), std::int64_t( i ) ) );

  const auto failure = std::make_error_code( std::errc::io_error );

  auto result = diff->each(
    [ & ]( std::span< const std::byte > id, const diffdb::codec::decoder& ) -> std::error_code
    {
      if( as_string( id ) == "2" )
        return failure;

      return {};
    } );

  ASSERT_FALSE( result );
  EXPECT_FALSE( result.error().cancelled() );
  EXPECT_EQ( result.error().code(), diffdb::differential_errc::apply_failed );
  ASSERT_EQ( result.error().failures().size(), 1 );
  EXPECT_EQ( as_string( result.error().failures()[ 0 ].id ), "2" );
  EXPECT_EQ( result.error().failures()[ 0 ].error, failure );
  EXPECT_NE( result.error().message().find( "0x32" ), std::string::npos );

  EXPECT_EQ( tracking(), 4 );
  EXPECT_EQ( changes(), 1 );

  auto changed = diff->changed( "2", std::int64_t( 2 ) );
  ASSERT_TRUE( changed );
  EXPECT_TRUE( *changed );
}

TEST_F( differential_test, failure_and_cancellation_in_one_pass )
{
  for( int i = 0; i < 10; ++i )
    ASSERT_TRUE( diff->add( "item" + std::to_string( i ), std::int64_t( i ) ) );

  std::stop_source source;
  int processed = 0;

  auto result = diff->each( source.get_token(),
                            [ & ]( std::span< const std::byte > id, const diffdb::codec::decoder& ) -> std::error_code
                            {
                              if( ++processed == 4 )
                                source.request_stop();

                              if( as_string( id ) == "item1" )
                                return std::make_error_code( std::errc::io_error );

                              return {};
                            } );

  ASSERT_FALSE( result );
  EXPECT_EQ( result.error().code(), diffdb::differential_errc::apply_failed );
  EXPECT_TRUE( result.error().cancelled() );
  ASSERT_EQ( result.error().failures().size(), 1 );
  EXPECT_EQ( as_string( result.error().failures()[ 0 ].id ), "item1" );

  // The item failure is listed first, the cancellation last
  const auto message = result.error().message();
  EXPECT_EQ( message.rfind( "2 errors occurred:", 0 ), 0 );

  const auto failure_at   = message.find( diffdb::encode::to_hex( diffdb::memory::as_bytes( std::string( "item1" ) ) ) );
  const auto cancelled_at = message.find( "apply was cancelled" );
  ASSERT_NE( failure_at, std::string::npos );
  ASSERT_NE( cancelled_at, std::string::npos );
  EXPECT_LT( failure_at, cancelled_at );

  EXPECT_EQ( processed, 4 );
  EXPECT_EQ( tracking(), 3 );
  EXPECT_EQ( changes(), 7 );
}

TEST_F( differential_test, reads_during_apply )
{
  ASSERT_TRUE( diff->add( "a", std::int64_t( 1 ) ) );
  ASSERT_TRUE( diff->each( []( auto, const auto& ) { return std::error_code(); } ) );

  ASSERT_TRUE( diff->add( "a", std::int64_t( 2 ) ) );
  ASSERT_TRUE( diff->add( "b", std::int64_t( 3 ) ) );

  int calls = 0;
  auto result = diff->each(
    [ & ]( std::span< const std::byte >, const diffdb::codec::decoder& ) -> std::error_code
    {
      ++calls;

      // Reads see the state committed before the pass started
      auto changed = diff->changed( "a", std::int64_t( 1 ) );
      EXPECT_TRUE( changed );
      EXPECT_FALSE( changed.value_or( true ) );

      auto count = diff->count_changes();
      EXPECT_TRUE( count );
      EXPECT_EQ( count.value_or( 0 ), 2 );

      // Writes wait for the pass to finish, a nested one cannot
      auto added = diff->add( "c", std::int64_t( 4 ) );
      EXPECT_FALSE( added );
      if( !added )
        EXPECT_EQ( added.error(), diffdb::storage::storage_errc::write_in_progress );

      return {};
    } );

  EXPECT_TRUE( result );
  EXPECT_EQ( calls, 2 );
  EXPECT_EQ( tracking(), 2 );
  EXPECT_EQ( changes(), 0 );

  auto changed = diff->changed( "a", std::int64_t( 2 ) );
  ASSERT_TRUE( changed );
  EXPECT_FALSE( *changed );
}

TEST_F( differential_test, ascending_identity_order )
{
  for( const auto* id: { "c", "a", "b" } )
    ASSERT_TRUE( diff->add( id, std::string( id ) ) );

  auto pending = diff->pending();
  ASSERT_TRUE( pending );
  ASSERT_EQ( pending->size(), 3 );
  EXPECT_EQ( as_string( pending->front() ), "a" );
  EXPECT_EQ( as_string( pending->back() ), "c" );

  std::vector< std::string > order;
  EXPECT_TRUE( diff->each(
    [ & ]( std::span< const std::byte > id, const diffdb::codec::decoder& ) -> std::error_code
    {
      order.push_back( as_string( id ) );
      return {};
    } ) );

  EXPECT_EQ( order, ( std::vector< std::string >{ "a", "b", "c" } ) );
}

TEST_F( differential_test, shared_fingerprint )
{
  ASSERT_TRUE( diff->add( "a", std::string( "same" ) ) );
  ASSERT_TRUE( diff->add( "b", std::string( "same" ) ) );

  auto result = diff->each(
    [ & ]( std::span< const std::byte > id, const diffdb::codec::decoder& ) -> std::error_code
    {
      if( as_string( id ) == "b" )
        return std::make_error_code( std::errc::operation_canceled );

      return {};
    } );

  ASSERT_FALSE( result );
  EXPECT_EQ( changes(), 1 );

  std::string value;
  EXPECT_TRUE( diff->each(
    [ & ]( std::span< const std::byte >, const diffdb::codec::decoder& data ) -> std::error_code
    {
      return data.decode( value );
    } ) );
  EXPECT_EQ( value, "same" );
  EXPECT_EQ( tracking(), 2 );
}

TEST_F( differential_test, identifiable_objects )
{
  row r{ "alice", 10, { { "tier", "gold" } } };

  auto added = diff->add( r );
  ASSERT_TRUE( added );
  EXPECT_TRUE( *added );

  added = diff->add( r );
  ASSERT_TRUE( added );
  EXPECT_FALSE( *added );

  row decoded;
  EXPECT_TRUE( diff->each(
    [ & ]( std::span< const std::byte > id, const diffdb::codec::decoder& data ) -> std::error_code
    {
      EXPECT_EQ( as_string( id ), "alice" );
      return data.decode( decoded );
    } ) );
  EXPECT_EQ( decoded, r );

  r.attributes[ "tier" ] = "silver";
  auto changed           = diff->changed( r.id(), r );
  ASSERT_TRUE( changed );
  EXPECT_TRUE( *changed );
}

TEST_F( differential_test, invalid_identity )
{
  auto added = diff->add( "", std::int64_t( 1 ) );
  ASSERT_FALSE( added );
  EXPECT_EQ( added.error(), diffdb::differential_errc::invalid_identity );

  auto changed = diff->changed( std::vector< std::byte >(), std::int64_t( 1 ) );
  ASSERT_FALSE( changed );
  EXPECT_EQ( changed.error(), diffdb::differential_errc::invalid_identity );

  EXPECT_EQ( changes(), 0 );
}

TEST_F( differential_test, binary_identities )
{
  std::vector< std::byte > id{ std::byte{ 0x00 }, std::byte{ 0xff }, std::byte{ 0x10 } };
  ASSERT_TRUE( diff->add( id, std::vector< std::int32_t >{ 1, 2, 3 } ) );

  EXPECT_TRUE( diff->each(
    [ & ]( std::span< const std::byte > applied, const diffdb::codec::decoder& data ) -> std::error_code
    {
      EXPECT_TRUE( std::ranges::equal( applied, id ) );

      std::vector< std::int32_t > values;
      if( auto ec = data.decode( values ); ec )
        return ec;

      EXPECT_EQ( values, ( std::vector< std::int32_t >{ 1, 2, 3 } ) );
      return {};
    } ) );
}

TEST_F( differential_test, user_data )
{
  EXPECT_FALSE( diff->update_user_data(
    []( diffdb::storage::bucket& b ) -> std::error_code
    {
      b.put( "last_run", diffdb::memory::to_vector( diffdb::memory::as_bytes( std::string( "yesterday" ) ) ) );
      return {};
    } ) );

  // An error from the callback discards its writes
  const auto failure = std::make_error_code( std::errc::invalid_argument );
  EXPECT_EQ( diff->update_user_data(
               [ & ]( diffdb::storage::bucket& b ) -> std::error_code
               {
                 b.put( "last_run", {} );
                 return failure;
               } ),
             failure );

  std::string last_run;
  EXPECT_FALSE( diff->view_user_data(
    [ & ]( const diffdb::storage::bucket& b ) -> std::error_code
    {
      EXPECT_FALSE( b.writable() );
      EXPECT_EQ( b.count(), 1 );

      if( auto value = b.get( "last_run" ); value )
        last_run = diffdb::memory::as_string_view( *value );

      return {};
    } ) );

  EXPECT_EQ( last_run, "yesterday" );

  // User data is not part of the change tracking state
  EXPECT_EQ( changes(), 0 );
  EXPECT_EQ( tracking(), 0 );
}

TEST_F( differential_test, persistence )
{
  ASSERT_TRUE( diff->add( "applied", std::int64_t( 1 ) ) );
  ASSERT_TRUE( diff->each( []( auto, const auto& ) { return std::error_code(); } ) );
  ASSERT_TRUE( diff->add( "pending", std::int64_t( 2 ) ) );

  diff.reset();
  db.close();

  ASSERT_FALSE( db.open( database_path() ) );
  auto reopened = db.open_differential( "test" );
  ASSERT_TRUE( reopened );
  diff = *reopened;

  EXPECT_EQ( tracking(), 1 );
  EXPECT_EQ( changes(), 1 );

  auto changed = diff->changed( "applied", std::int64_t( 1 ) );
  ASSERT_TRUE( changed );
  EXPECT_FALSE( *changed );

  std::int64_t value = 0;
  EXPECT_TRUE( diff->each( [ & ]( auto, const diffdb::codec::decoder& data ) { return data.decode( value ); } ) );
  EXPECT_EQ( value, 2 );
}

TEST_F( differential_test, collections )
{
  ASSERT_TRUE( db.open_differential( "other" ) );

  auto names = db.collections();
  ASSERT_TRUE( names );
  EXPECT_EQ( *names, ( std::vector< std::string >{ "other", "test" } ) );

  auto invalid = db.open_differential( "" );
  ASSERT_FALSE( invalid );
  EXPECT_EQ( invalid.error(), diffdb::differential_errc::invalid_identity );
}

TEST_F( differential_test, find_collection )
{
  ASSERT_TRUE( diff->add( "x", std::int64_t( 1 ) ) );

  auto found = db.find_differential( "test" );
  ASSERT_TRUE( found );
  EXPECT_EQ( ( *found )->count_changes().value_or( 0 ), 1 );

  // Looking up a missing collection does not create it
  auto missing = db.find_differential( "tset" );
  ASSERT_FALSE( missing );
  EXPECT_EQ( missing.error(), diffdb::differential_errc::collection_not_found );

  auto names = db.collections();
  ASSERT_TRUE( names );
  EXPECT_EQ( *names, std::vector< std::string >{ "test" } );

  auto invalid = db.find_differential( "" );
  ASSERT_FALSE( invalid );
  EXPECT_EQ( invalid.error(), diffdb::differential_errc::invalid_identity );
}

TEST_F( differential_test, remove_collection )
{
  ASSERT_TRUE( diff->add( "x", std::int64_t( 1 ) ) );
  ASSERT_TRUE( diff->each( []( auto, const auto& ) { return std::error_code(); } ) );
  ASSERT_TRUE( diff->add( "y", std::int64_t( 2 ) ) );

  EXPECT_FALSE( db.remove( "test" ) );
  EXPECT_EQ( db.remove( "test" ), diffdb::differential_errc::collection_not_found );

  // Handles to a removed collection report it as missing
  auto stale = diff->count_changes();
  ASSERT_FALSE( stale );
  EXPECT_EQ( stale.error(), diffdb::differential_errc::collection_not_found );

  auto added = diff->add( "z", std::int64_t( 3 ) );
  ASSERT_FALSE( added );
  EXPECT_EQ( added.error(), diffdb::differential_errc::collection_not_found );

  EXPECT_EQ( diff->reset_conflict_tracking(), diffdb::differential_errc::collection_not_found );

  auto reopened = db.open_differential( "test" );
  ASSERT_TRUE( reopened );
  diff = *reopened;

  EXPECT_EQ( tracking(), 0 );
  EXPECT_EQ( changes(), 0 );
}

TEST_F( differential_test, closed_database )
{
  db.close();

  auto added = diff->add( "x", std::int64_t( 1 ) );
  ASSERT_FALSE( added );
  EXPECT_EQ( added.error(), diffdb::storage::storage_errc::database_not_open );

  auto result = diff->each( []( auto, const auto& ) { return std::error_code(); } );
  ASSERT_FALSE( result );
  EXPECT_EQ( result.error().code(), diffdb::storage::storage_errc::database_not_open );
  EXPECT_TRUE( result.error().failures().empty() );

  EXPECT_FALSE( db.collections() );
}

TEST( differential, missing_payload )
{
  auto storage = std::make_shared< diffdb::storage::database >();
  storage->open( std::nullopt );

  const diffdb::storage::region root( "broken" );
  const auto payloads = root.child( diffdb::region_name::payloads );

  storage->update(
    [ & ]( diffdb::storage::transaction& trx )
    {
      for( auto name: { diffdb::region_name::committed,
                        diffdb::region_name::pending,
                        diffdb::region_name::payloads,
                        diffdb::region_name::user_data } )
        trx.create_region( root.child( name ) );
    } );

  diffdb::differential diff( storage, "broken" );

  for( const auto* id: { "a", "b", "c" } )
    ASSERT_TRUE( diff.add( id, std::string( id ) ) );

  storage->update( [ & ]( diffdb::storage::transaction& trx )
                   { trx.remove( payloads, diffdb::memory::as_bytes( std::string_view( "b" ) ) ); } );

  std::vector< std::string > seen;
  EXPECT_THROW( diff.each(
                  [ & ]( std::span< const std::byte > id, const diffdb::codec::decoder& ) -> std::error_code
                  {
                    seen.push_back( as_string( id ) );
                    return {};
                  } ),
                std::logic_error );

  // "a" was applied before the pass hit "b", the rollback undoes it
  EXPECT_EQ( seen, std::vector< std::string >{ "a" } );
  EXPECT_EQ( diff.count_tracking().value_or( 1 ), 0 );
  EXPECT_EQ( diff.count_changes().value_or( 0 ), 3 );

  auto changed = diff.changed( "a", std::string( "a" ) );
  ASSERT_TRUE( changed );
  EXPECT_TRUE( *changed );
}

TEST( differential, trackable_values )
{
  static_assert( diffdb::Trackable< std::int64_t > );
  static_assert( diffdb::Trackable< std::string > );
  static_assert( diffdb::Trackable< row > );

  static_assert( !diffdb::Trackable< std::string_view > );
  static_assert( !diffdb::Trackable< const char* > );
  static_assert( !diffdb::Trackable< std::span< const std::byte > > );
}

TEST( differential, in_memory )
{
  diffdb::database db;
  ASSERT_FALSE( db.open() );

  auto diff = db.open_differential( "memory" );
  ASSERT_TRUE( diff );

  ASSERT_TRUE( ( *diff )->add( "x", std::int64_t( 1 ) ) );
  EXPECT_EQ( ( *diff )->count_changes().value_or( 0 ), 1 );

  EXPECT_TRUE( ( *diff )->each( []( auto, const auto& ) { return std::error_code(); } ) );
  EXPECT_EQ( ( *diff )->count_tracking().value_or( 0 ), 1 );
}

// NOLINTEND
