#pragma once

#include <diffdb/storage/backends/backend.hpp>

#include <filesystem>
#include <memory>

#include <sqlite3.h>

namespace diffdb::storage::backends::sqlite {

/**
 * Stores every key in one kv table of a SQLite database in WAL mode.
 *
 * A snapshot is a second connection to the same file holding an open read
 * transaction, so it keeps seeing the state it was opened on while the
 * writing connection commits.
 */
class sqlite_backend final: public abstract_backend
{
public:
  enum class mode
  {
    read_write,
    snapshot
  };

  sqlite_backend( const sqlite_backend& )            = delete;
  sqlite_backend( sqlite_backend&& )                 = delete;
  sqlite_backend& operator=( const sqlite_backend& ) = delete;
  sqlite_backend& operator=( sqlite_backend&& )      = delete;
  explicit sqlite_backend( const std::filesystem::path& path, mode m = mode::read_write );
  ~sqlite_backend() final;

  // Iterators
  iterator begin() final;
  iterator end() final;
  iterator lower_bound( const std::vector< std::byte >& key ) final;

  // Modifiers
  void put( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) final;
  std::optional< std::vector< std::byte > > get( const std::vector< std::byte >& key ) const final;
  void remove( const std::vector< std::byte >& key ) final;

  std::uint64_t size() const final;

  void start_write_batch() final;
  void end_write_batch() final;
  void abort_write_batch() final;

  std::unique_ptr< abstract_backend > snapshot() const final;

private:
  struct connection_deleter
  {
    void operator()( sqlite3* db ) const noexcept;
  };

  void check_writable() const;
  void rollback() noexcept;

  std::filesystem::path _path;
  mode _mode;
  std::unique_ptr< sqlite3, connection_deleter > _db;
  bool _in_batch = false;
};

} // namespace diffdb::storage::backends::sqlite
