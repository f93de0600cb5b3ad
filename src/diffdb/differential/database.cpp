#include <diffdb/differential/database.hpp>

#include <diffdb/log.hpp>
#include <diffdb/storage/error.hpp>

#include <algorithm>

namespace diffdb {

database::database():
    _db( std::make_shared< storage::database >() )
{}

database::~database()
{
  close();
}

std::error_code database::open( const std::filesystem::path& path )
{
  return open_backend( std::optional< std::filesystem::path >( path ) );
}

std::error_code database::open()
{
  return open_backend( std::optional< std::filesystem::path >() );
}

std::error_code database::open_backend( const std::optional< std::filesystem::path >& path )
{
  try
  {
    _db->open( path );
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to open database: {}", std::string( e.what() ) );
    return e.code();
  }

  return {};
}

void database::close()
{
  _db->close();
}

bool database::is_open() const
{
  return _db->is_open();
}

result< std::shared_ptr< differential > > database::open_differential( std::string_view name )
{
  if( name.empty() )
    return std::unexpected( differential_errc::invalid_identity );

  try
  {
    storage::region root( name );
    bool created = false;

    _db->update(
      [ & ]( storage::transaction& trx )
      {
        created = !trx.region_exists( root );

        for( auto sub: { region_name::committed, region_name::pending, region_name::payloads, region_name::user_data } )
          trx.create_region( root.child( sub ) );
      } );

    if( created )
      LOG_INFO( diffdb::log::instance(), "Created collection {}", std::string( name ) );
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to open collection {}: {}", std::string( name ), std::string( e.what() ) );
    return std::unexpected( e.code() );
  }

  return std::make_shared< differential >( _db, std::string( name ) );
}

result< std::shared_ptr< differential > > database::find_differential( std::string_view name ) const
{
  if( name.empty() )
    return std::unexpected( differential_errc::invalid_identity );

  try
  {
    bool found = false;
    _db->view( [ & ]( const storage::transaction& trx ) { found = trx.region_exists( storage::region( name ) ); } );

    if( !found )
      return std::unexpected( differential_errc::collection_not_found );
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to find collection {}: {}", std::string( name ), std::string( e.what() ) );
    return std::unexpected( e.code() );
  }

  return std::make_shared< differential >( _db, std::string( name ) );
}

std::error_code database::remove( std::string_view name )
{
  if( name.empty() )
    return differential_errc::invalid_identity;

  try
  {
    storage::region root( name );
    bool found = false;

    _db->update(
      [ & ]( storage::transaction& trx )
      {
        found = trx.region_exists( root );

        if( found )
          trx.remove_region( root );
      } );

    if( !found )
      return differential_errc::collection_not_found;
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to remove collection {}: {}", std::string( name ), std::string( e.what() ) );
    return e.code();
  }

  LOG_INFO( diffdb::log::instance(), "Deleted collection {}", std::string( name ) );
  return {};
}

result< std::vector< std::string > > database::collections() const
{
  std::vector< std::string > names;

  try
  {
    _db->view(
      [ & ]( const storage::transaction& trx )
      {
        for( const auto& r: trx.regions() )
        {
          if( r.path().size() == 1 )
            names.push_back( r.name() );
        }
      } );
  }
  catch( const std::system_error& e )
  {
    LOG_ERROR( diffdb::log::instance(), "Unable to list collections: {}", std::string( e.what() ) );
    return std::unexpected( e.code() );
  }

  std::ranges::sort( names );
  return names;
}

} // namespace diffdb
