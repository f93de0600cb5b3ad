#include "sqlite_backend.hpp"
#include "sqlite_iterator.hpp"
#include "statement.hpp"

#include <diffdb/log.hpp>
#include <diffdb/storage/error.hpp>

#include <string>

namespace diffdb::storage::backends::sqlite {

void sqlite_backend::connection_deleter::operator()( sqlite3* db ) const noexcept
{
  sqlite3_close_v2( db );
}

sqlite_backend::sqlite_backend( const std::filesystem::path& path, mode m ):
    _path( path ),
    _mode( m )
{
  const int flags = m == mode::snapshot ? SQLITE_OPEN_READWRITE : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

  sqlite3* db = nullptr;
  auto rc     = sqlite3_open_v2( path.c_str(), &db, flags, nullptr );
  _db.reset( db );

  if( rc != SQLITE_OK )
    throw storage_error( storage_errc::backend_failure,
                         "unable to open " + path.string() + ": " + std::string( sqlite3_errstr( rc ) ) );

  if( m == mode::snapshot )
  {
    // A deferred transaction takes its snapshot at the first read
    execute( _db.get(), "BEGIN" );
    statement( _db.get(), "SELECT 1 FROM kv LIMIT 1" ).step();
    return;
  }

  execute( _db.get(), "PRAGMA journal_mode = WAL" );
  execute( _db.get(), "PRAGMA synchronous = FULL" );
  execute( _db.get(), "CREATE TABLE IF NOT EXISTS kv ( key BLOB PRIMARY KEY, value BLOB NOT NULL ) WITHOUT ROWID" );

  LOG_DEBUG( diffdb::log::instance(), "Opened sqlite backend at {}", path.string() );
}

sqlite_backend::~sqlite_backend()
{
  if( _in_batch || _mode == mode::snapshot )
    rollback();
}

void sqlite_backend::check_writable() const
{
  if( _mode == mode::snapshot )
    throw storage_error( storage_errc::read_only_transaction );
}

void sqlite_backend::rollback() noexcept
{
  if( sqlite3_exec( _db.get(), "ROLLBACK", nullptr, nullptr, nullptr ) != SQLITE_OK )
    LOG_ERROR( diffdb::log::instance(), "Rollback failed: {}", std::string( sqlite3_errmsg( _db.get() ) ) );
}

iterator sqlite_backend::begin()
{
  return iterator( std::make_unique< sqlite_iterator >( _db.get(), sqlite_iterator::first( _db.get() ) ) );
}

iterator sqlite_backend::end()
{
  return iterator( std::make_unique< sqlite_iterator >( _db.get(), std::nullopt ) );
}

iterator sqlite_backend::lower_bound( const std::vector< std::byte >& key )
{
  return iterator( std::make_unique< sqlite_iterator >( _db.get(), sqlite_iterator::seek( _db.get(), key, true ) ) );
}

void sqlite_backend::put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
{
  check_writable();

  statement stmt( _db.get(), "INSERT OR REPLACE INTO kv ( key, value ) VALUES ( ?1, ?2 )" );
  stmt.bind( 1, key );
  stmt.bind( 2, value );
  stmt.step();
}

std::optional< std::vector< std::byte > > sqlite_backend::get( const std::vector< std::byte >& key ) const
{
  statement stmt( _db.get(), "SELECT value FROM kv WHERE key = ?1" );
  stmt.bind( 1, key );

  if( !stmt.step() )
    return {};

  return stmt.column_blob( 0 );
}

void sqlite_backend::remove( const std::vector< std::byte >& key )
{
  check_writable();

  statement stmt( _db.get(), "DELETE FROM kv WHERE key = ?1" );
  stmt.bind( 1, key );
  stmt.step();
}

std::uint64_t sqlite_backend::size() const
{
  statement stmt( _db.get(), "SELECT COUNT(*) FROM kv" );
  stmt.step();
  return static_cast< std::uint64_t >( stmt.column_int64( 0 ) );
}

void sqlite_backend::start_write_batch()
{
  check_writable();

  if( _in_batch )
    throw storage_error( storage_errc::backend_failure, "write batch already started" );

  execute( _db.get(), "BEGIN IMMEDIATE" );
  _in_batch = true;
}

void sqlite_backend::end_write_batch()
{
  if( !_in_batch )
    throw storage_error( storage_errc::backend_failure, "no write batch in progress" );

  execute( _db.get(), "COMMIT" );
  _in_batch = false;
}

void sqlite_backend::abort_write_batch()
{
  if( !_in_batch )
    return;

  _in_batch = false;
  rollback();
}

std::unique_ptr< abstract_backend > sqlite_backend::snapshot() const
{
  return std::make_unique< sqlite_backend >( _path, mode::snapshot );
}

} // namespace diffdb::storage::backends::sqlite
