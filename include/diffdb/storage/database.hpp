#pragma once

#include <diffdb/storage/backends/backend.hpp>
#include <diffdb/storage/transaction.hpp>

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>

namespace diffdb::storage {

/**
 * Owns a backend and hands out transactions on it.
 *
 * Writable transactions run one at a time. Read-only transactions read a
 * snapshot and may be opened at any time, including by the thread holding
 * the writable transaction. Opening a second writable transaction on the
 * thread that already holds one throws write_in_progress.
 */
class database final
{
public:
  database();
  database( const database& )            = delete;
  database( database&& )                 = delete;
  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;
  ~database();

  /**
   * Opens a SQLite database file at path, or an in-memory database when no
   * path is given.
   */
  void open( const std::optional< std::filesystem::path >& path );
  void close();
  bool is_open() const;

  std::unique_ptr< transaction > begin( bool writable );

  /**
   * Runs fn in a writable transaction and commits it if fn returns.
   */
  template< typename Fn >
  void update( Fn&& fn )
  {
    auto trx = begin( true );
    fn( *trx );
    trx->commit();
  }

  /**
   * Runs fn in a read-only transaction.
   */
  template< typename Fn >
  void view( Fn&& fn )
  {
    auto trx = begin( false );
    fn( static_cast< const transaction& >( *trx ) );
    trx->commit();
  }

private:
  std::unique_ptr< backends::abstract_backend > _backend;

  // Guards _backend itself, held exclusively while a commit is applied
  mutable std::shared_mutex _mutex;
  std::mutex _writer;
  std::atomic< std::thread::id > _writer_thread;
};

} // namespace diffdb::storage
