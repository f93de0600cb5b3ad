#pragma once

#include <diffdb/storage/backends/backend.hpp>
#include <diffdb/storage/region.hpp>
#include <diffdb/storage/types.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <span>
#include <thread>
#include <vector>

namespace diffdb::storage {

class database;

/**
 * A consistent view of the database.
 *
 * A read-only transaction reads a backend snapshot taken when it began and
 * never waits for writers. A writable transaction holds the database writer
 * lock for its lifetime, so writers run one at a time. Writes are staged in
 * the transaction and reach the backend in a single write batch on commit().
 * A transaction that is destroyed without being committed is rolled back.
 */
class transaction final
{
public:
  /**
   * Only a database can begin a transaction.
   */
  class access_key
  {
    friend class database;
    access_key() = default;
  };

  transaction( access_key, std::unique_ptr< backends::abstract_backend > snapshot );
  transaction( access_key,
               backends::abstract_backend& backend,
               std::unique_lock< std::mutex > writer,
               std::shared_mutex& publish,
               std::atomic< std::thread::id >& writer_thread );
  transaction( const transaction& )            = delete;
  transaction( transaction&& )                 = delete;
  transaction& operator=( const transaction& ) = delete;
  transaction& operator=( transaction&& )      = delete;
  ~transaction();

  bool writable() const noexcept;
  bool is_open() const noexcept;

  std::optional< std::vector< std::byte > > get( const region& r, std::span< const std::byte > key ) const;
  void put( const region& r, std::span< const std::byte > key, std::vector< std::byte > value );
  void remove( const region& r, std::span< const std::byte > key );

  /**
   * Returns the entry with the lowest item key in the region.
   */
  std::optional< entry > first( const region& r ) const;

  /**
   * Returns the entry with the lowest item key greater than key.
   */
  std::optional< entry > next( const region& r, std::span< const std::byte > key ) const;

  std::uint64_t count( const region& r ) const;

  /**
   * Creates the region and any missing ancestors. Creating an existing
   * region is a nop.
   */
  void create_region( const region& r );

  /**
   * Removes the region with all of its items and descendants.
   */
  void remove_region( const region& r );
  bool region_exists( const region& r ) const;

  /**
   * Lists every region in the catalog, ordered by path.
   */
  std::vector< region > regions() const;

  void commit();
  void rollback() noexcept;

private:
  void check_open() const;
  void check_writable() const;
  void check_region( const region& r ) const;

  std::optional< std::vector< std::byte > > read( const std::vector< std::byte >& key ) const;
  void write( std::vector< std::byte > key, std::vector< std::byte > value );
  void erase( const std::vector< std::byte >& key );
  void erase_prefix( const std::vector< std::byte >& prefix );

  std::optional< entry > seek( const std::vector< std::byte >& key, bool inclusive ) const;
  std::optional< entry > seek_in( const region& r, const std::vector< std::byte >& key, bool inclusive ) const;

  std::unique_ptr< backends::abstract_backend > _snapshot;
  backends::abstract_backend& _backend;
  std::unique_ptr< backends::abstract_backend > _writes;
  std::set< std::vector< std::byte > > _removed;

  std::unique_lock< std::mutex > _writer;
  std::shared_mutex* _publish                    = nullptr;
  std::atomic< std::thread::id >* _writer_thread = nullptr;
  bool _writable                                 = false;
  bool _open                                     = true;
};

} // namespace diffdb::storage
