#include "statement.hpp"

#include <diffdb/memory.hpp>
#include <diffdb/storage/error.hpp>

#include <string>

namespace diffdb::storage::backends::sqlite {

namespace {

[[noreturn]] void throw_sqlite_error( sqlite3* db, std::string_view operation )
{
  throw storage_error( storage_errc::backend_failure,
                       std::string( operation ) + ": " + std::string( sqlite3_errmsg( db ) ) );
}

} // namespace

statement::statement( sqlite3* db, std::string_view sql ):
    _db( db )
{
  if( sqlite3_prepare_v2( _db, sql.data(), static_cast< int >( sql.size() ), &_stmt, nullptr ) != SQLITE_OK )
    throw_sqlite_error( _db, "prepare" );
}

statement::~statement()
{
  if( _stmt )
    sqlite3_finalize( _stmt );
}

void statement::bind( int index, std::span< const std::byte > blob )
{
  // A zero length blob must still bind as a blob, not NULL
  static constexpr char empty = 0;
  const void* data            = blob.empty() ? &empty : static_cast< const void* >( blob.data() );

  if( sqlite3_bind_blob( _stmt, index, data, static_cast< int >( blob.size() ), SQLITE_TRANSIENT ) != SQLITE_OK )
    throw_sqlite_error( _db, "bind" );
}

bool statement::step()
{
  switch( sqlite3_step( _stmt ) )
  {
    case SQLITE_ROW:
      return true;
    case SQLITE_DONE:
      return false;
    default:
      throw_sqlite_error( _db, "step" );
  }
}

std::vector< std::byte > statement::column_blob( int index ) const
{
  const auto* data = memory::pointer_cast< const std::byte* >( sqlite3_column_blob( _stmt, index ) );
  const auto size  = static_cast< std::size_t >( sqlite3_column_bytes( _stmt, index ) );

  if( data == nullptr )
    return {};

  return std::vector< std::byte >( data, data + size );
}

std::int64_t statement::column_int64( int index ) const
{
  return sqlite3_column_int64( _stmt, index );
}

void execute( sqlite3* db, std::string_view sql )
{
  statement stmt( db, sql );
  stmt.step();
}

} // namespace diffdb::storage::backends::sqlite
