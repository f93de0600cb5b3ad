#pragma once

#include <diffdb/storage/backends/iterator.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace diffdb::storage::backends {

/**
 * An ordered byte keyed store. Keys are ordered by unsigned byte comparison.
 *
 * Backends throw storage_error on I/O failure. Writes made between
 * start_write_batch() and end_write_batch() become durable together, or not
 * at all if abort_write_batch() is called instead.
 */
class abstract_backend
{
public:
  abstract_backend()                                     = default;
  abstract_backend( const abstract_backend& )            = default;
  abstract_backend( abstract_backend&& )                 = delete;
  abstract_backend& operator=( const abstract_backend& ) = default;
  abstract_backend& operator=( abstract_backend&& )      = delete;
  virtual ~abstract_backend()                            = default;

  virtual iterator begin() = 0;
  virtual iterator end()   = 0;

  /**
   * Returns an iterator to the first key not less than key.
   */
  virtual iterator lower_bound( const std::vector< std::byte >& key ) = 0;

  virtual void put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )      = 0;
  virtual std::optional< std::vector< std::byte > > get( const std::vector< std::byte >& key ) const = 0;
  virtual void remove( const std::vector< std::byte >& key )                                 = 0;

  virtual std::uint64_t size() const = 0;

  virtual void start_write_batch() = 0;
  virtual void end_write_batch()   = 0;
  virtual void abort_write_batch() = 0;

  /**
   * Returns a read-only view of the backend as of this call. Later writes are
   * not visible through it and it can be read from another thread while this
   * backend is being written. Writes to the view throw storage_error.
   */
  virtual std::unique_ptr< abstract_backend > snapshot() const = 0;
};

} // namespace diffdb::storage::backends
