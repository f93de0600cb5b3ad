#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <sqlite3.h>

namespace diffdb::storage::backends::sqlite {

/**
 * Owns a prepared statement. Step results other than SQLITE_ROW and
 * SQLITE_DONE are thrown as storage_error.
 */
class statement final
{
public:
  statement( sqlite3* db, std::string_view sql );
  statement( const statement& )            = delete;
  statement( statement&& )                 = delete;
  statement& operator=( const statement& ) = delete;
  statement& operator=( statement&& )      = delete;
  ~statement();

  void bind( int index, std::span< const std::byte > blob );

  /**
   * Advances the statement, returns true while a row is available.
   */
  bool step();

  std::vector< std::byte > column_blob( int index ) const;
  std::int64_t column_int64( int index ) const;

private:
  sqlite3* _db        = nullptr;
  sqlite3_stmt* _stmt = nullptr;
};

/**
 * Runs a statement that returns no rows.
 */
void execute( sqlite3* db, std::string_view sql );

} // namespace diffdb::storage::backends::sqlite
