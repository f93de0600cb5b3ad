#include <diffdb/differential/differential.hpp>

#include <diffdb/log.hpp>
#include <diffdb/storage/error.hpp>

#include "scan.hpp"

#include <algorithm>
#include <utility>

namespace diffdb {

namespace {

std::error_code to_error_code( const std::system_error& e )
{
  if( e.code() == storage::storage_errc::region_not_found )
    return differential_errc::collection_not_found;

  return e.code();
}

} // namespace

differential::differential( std::shared_ptr< storage::database > db, std::string name ):
    _db( std::move( db ) ),
    _name( std::move( name ) ),
    _root( _name ),
    _committed( _root.child( region_name::committed ) ),
    _pending( _root.child( region_name::pending ) ),
    _payloads( _root.child( region_name::payloads ) ),
    _user_data( _root.child( region_name::user_data ) ),
    _conflicts( _root.child( region_name::conflicts ) )
{}

differential::~differential() {}

const std::string& differential::name() const noexcept
{
  return _name;
}

result< bool >
differential::stage( std::span< const std::byte > id, crypto::digest fingerprint, const encode_function& encode )
{
  if( id.empty() )
    return std::unexpected( differential_errc::invalid_identity );

  try
  {
    auto trx = _db->begin( true );

    if( _track_conflicts && trx->get( _conflicts, id ) )
    {
      LOG_DEBUG( diffdb::log::instance(),
                 "Rejected second change to {} in {}",
                 diffdb::log::hex{ id.data(), id.size() },
                 _name );
      return std::unexpected( differential_errc::conflicting_identity );
    }

    const auto stored = crypto::to_bytes( fingerprint );
    const auto same   = [ &stored ]( const std::vector< std::byte >& other )
    {
      return std::ranges::equal( stored, other );
    };

    if( auto committed = trx->get( _committed, id ); committed && same( *committed ) )
      return false;

    if( auto pending = trx->get( _pending, id ); pending && same( *pending ) )
      return false;

    auto payload = encode();
    if( !payload )
      return std::unexpected( payload.error() );

    trx->put( _pending, id, std::vector< std::byte >( stored.begin(), stored.end() ) );
    trx->put( _payloads, id, std::move( *payload ) );

    if( _track_conflicts )
      trx->put( _conflicts, id, {} );

    trx->commit();

    LOG_DEBUG( diffdb::log::instance(),
               "Staged change to {} at {} in {}",
               diffdb::log::hex{ id.data(), id.size() },
               diffdb::log::fingerprint{ fingerprint },
               _name );
    return true;
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to stage change in {}: {}", _name, std::string( e.what() ) );
    return std::unexpected( to_error_code( e ) );
  }
}

result< bool > differential::compare( std::span< const std::byte > id, crypto::digest fingerprint ) const
{
  if( id.empty() )
    return std::unexpected( differential_errc::invalid_identity );

  try
  {
    auto trx       = _db->begin( false );
    auto committed = trx->get( _committed, id );
    trx->commit();

    if( !committed )
      return true;

    auto digest = crypto::from_bytes( *committed );
    if( !digest )
      return std::unexpected( digest.error() );

    return *digest != fingerprint;
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to read {}: {}", _name, std::string( e.what() ) );
    return std::unexpected( to_error_code( e ) );
  }
}

result< std::uint64_t > differential::count_tracking() const
{
  try
  {
    auto trx   = _db->begin( false );
    auto count = trx->count( _committed );
    trx->commit();
    return count;
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to read {}: {}", _name, std::string( e.what() ) );
    return std::unexpected( to_error_code( e ) );
  }
}

result< std::uint64_t > differential::count_changes() const
{
  try
  {
    auto trx   = _db->begin( false );
    auto count = trx->count( _pending );
    trx->commit();
    return count;
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to read {}: {}", _name, std::string( e.what() ) );
    return std::unexpected( to_error_code( e ) );
  }
}

result< std::vector< std::vector< std::byte > > > differential::pending() const
{
  std::vector< std::vector< std::byte > > ids;

  try
  {
    auto trx = _db->begin( false );
    storage::bucket b( *trx, _pending );
    b.for_each(
      [ &ids ]( const storage::entry& e )
      {
        ids.push_back( e.first );
        return true;
      } );
    trx->commit();
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to read {}: {}", _name, std::string( e.what() ) );
    return std::unexpected( to_error_code( e ) );
  }

  return ids;
}

std::error_code differential::reset_conflict_tracking()
{
  try
  {
    auto trx = _db->begin( true );

    if( !trx->region_exists( _root ) )
      return differential_errc::collection_not_found;

    if( trx->region_exists( _conflicts ) )
      trx->remove_region( _conflicts );

    trx->create_region( _conflicts );
    trx->commit();
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to reset conflicts in {}: {}", _name, std::string( e.what() ) );
    return to_error_code( e );
  }

  _track_conflicts = true;
  LOG_DEBUG( diffdb::log::instance(), "Started a new conflict tracking cycle in {}", _name );
  return {};
}

bool differential::tracking_conflicts() const noexcept
{
  return _track_conflicts;
}

apply_result differential::each( std::stop_token stop, const apply_function& fn )
{
  std::vector< apply_failure > failures;
  bool cancelled       = false;
  std::uint64_t applied = 0;

  try
  {
    detail::scan s( *_db, _pending, _payloads, _committed );

    for( auto e = s.first(); e; e = s.next( e->first ) )
    {
      if( stop.stop_requested() )
      {
        cancelled = true;
        break;
      }

      const auto payload = s.payload( e->first );
      const codec::decoder decoder( payload );

      if( auto ec = fn( e->first, decoder ); ec )
      {
        LOG_WARNING( diffdb::log::instance(),
                     "Failed to apply change to {} in {}: {}",
                     diffdb::log::hex{ e->first.data(), e->first.size() },
                     _name,
                     ec.message() );
        failures.push_back( apply_failure{ e->first, ec } );
        continue;
      }

      s.promote( e->first, std::move( e->second ) );
      ++applied;

      LOG_DEBUG( diffdb::log::instance(),
                 "Applied change to {} in {}",
                 diffdb::log::hex{ e->first.data(), e->first.size() },
                 _name );
    }

    s.commit();
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to apply changes in {}: {}", _name, std::string( e.what() ) );
    return std::unexpected( apply_error( to_error_code( e ) ) );
  }

  if( cancelled )
    LOG_WARNING( diffdb::log::instance(), "Apply in {} was cancelled after {} changes", _name, applied );

  if( failures.empty() && !cancelled )
    return {};

  return std::unexpected( apply_error( std::move( failures ), cancelled ) );
}

apply_result differential::each( const apply_function& fn )
{
  return each( std::stop_token(), fn );
}

std::error_code differential::view_user_data( const view_function& fn ) const
{
  try
  {
    auto trx = _db->begin( false );
    const storage::bucket b( *trx, _user_data );

    if( auto ec = fn( b ); ec )
      return ec;

    trx->commit();
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to read user data in {}: {}", _name, std::string( e.what() ) );
    return to_error_code( e );
  }

  return {};
}

std::error_code differential::update_user_data( const update_function& fn )
{
  try
  {
    auto trx = _db->begin( true );
    storage::bucket b( *trx, _user_data );

    if( auto ec = fn( b ); ec )
      return ec;

    trx->commit();
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to update user data in {}: {}", _name, std::string( e.what() ) );
    return to_error_code( e );
  }

  return {};
}

} // namespace diffdb
