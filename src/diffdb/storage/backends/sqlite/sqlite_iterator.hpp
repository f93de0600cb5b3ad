#pragma once

#include <diffdb/storage/backends/iterator.hpp>

#include <optional>

#include <sqlite3.h>

namespace diffdb::storage::backends::sqlite {

/**
 * A cursor over the kv table. The current row is copied out, each step is a
 * keyed seek, so the iterator stays usable across writes to the table.
 */
class sqlite_iterator final: public abstract_iterator
{
public:
  using value_type = std::pair< const std::vector< std::byte >, std::vector< std::byte > >;

  sqlite_iterator( const sqlite_iterator& )            = delete;
  sqlite_iterator( sqlite_iterator&& )                 = delete;
  sqlite_iterator& operator=( const sqlite_iterator& ) = delete;
  sqlite_iterator& operator=( sqlite_iterator&& )      = delete;
  sqlite_iterator( sqlite3* db, std::optional< value_type > current );
  ~sqlite_iterator() final;

  const value_type& operator*() const override;

  abstract_iterator& operator++() override;

  static std::optional< value_type > first( sqlite3* db );
  static std::optional< value_type > seek( sqlite3* db, const std::vector< std::byte >& key, bool inclusive );

private:
  bool valid() const override;
  std::unique_ptr< abstract_iterator > copy() const override;

  sqlite3* _db;
  std::optional< value_type > _current;
};

} // namespace diffdb::storage::backends::sqlite
