#include <diffdb/storage/database.hpp>

#include <diffdb/log.hpp>
#include <diffdb/storage/backends/map/map_backend.hpp>
#include <diffdb/storage/backends/sqlite/sqlite_backend.hpp>
#include <diffdb/storage/error.hpp>

#include <mutex>

namespace diffdb::storage {

database::database() {}

database::~database()
{
  close();
}

void database::open( const std::optional< std::filesystem::path >& path )
{
  std::unique_lock writer( _writer );
  std::unique_lock lock( _mutex );

  if( _backend )
    throw storage_error( storage_errc::database_already_open );

  if( path )
  {
    if( path->has_parent_path() && !std::filesystem::exists( path->parent_path() ) )
      std::filesystem::create_directories( path->parent_path() );

    _backend = std::make_unique< backends::sqlite::sqlite_backend >( *path );
    LOG_INFO( diffdb::log::instance(), "Opened database at {}", path->string() );
  }
  else
  {
    _backend = std::make_unique< backends::map::map_backend >();
    LOG_INFO( diffdb::log::instance(), "Opened in-memory database" );
  }
}

void database::close()
{
  std::unique_lock writer( _writer );
  std::unique_lock lock( _mutex );

  if( _backend )
  {
    _backend.reset();
    LOG_DEBUG( diffdb::log::instance(), "Closed database" );
  }
}

bool database::is_open() const
{
  std::shared_lock lock( _mutex );
  return _backend != nullptr;
}

std::unique_ptr< transaction > database::begin( bool writable )
{
  if( !writable )
  {
    std::shared_lock lock( _mutex );
    if( !_backend )
      throw storage_error( storage_errc::database_not_open );

    return std::make_unique< transaction >( transaction::access_key(), _backend->snapshot() );
  }

  if( _writer_thread.load() == std::this_thread::get_id() )
    throw storage_error( storage_errc::write_in_progress );

  std::unique_lock writer( _writer );

  if( !is_open() )
    throw storage_error( storage_errc::database_not_open );

  return std::make_unique< transaction >(
    transaction::access_key(), *_backend, std::move( writer ), _mutex, _writer_thread );
}

} // namespace diffdb::storage
