#pragma once

#include <diffdb/storage/backends/backend.hpp>

#include "map_iterator.hpp"

#include <memory>

namespace diffdb::storage::backends::map {

/**
 * An in-memory backend. The map is shared copy on write between the backend,
 * its snapshots and an open write batch, the first write after a share copies
 * it.
 */
class map_backend final: public abstract_backend
{
public:
  map_backend();
  map_backend( const map_backend& )            = delete;
  map_backend( map_backend&& )                 = delete;
  map_backend& operator=( const map_backend& ) = delete;
  map_backend& operator=( map_backend&& )      = delete;
  ~map_backend() final;

  // Iterators
  iterator begin() noexcept final;
  iterator end() noexcept final;
  iterator lower_bound( const std::vector< std::byte >& key ) final;

  // Modifiers
  void put( std::vector< std::byte >&& key, std::vector< std::byte >&& value ) final;
  std::optional< std::vector< std::byte > > get( const std::vector< std::byte >& key ) const final;
  void remove( const std::vector< std::byte >& key ) final;

  std::uint64_t size() const noexcept final;

  void start_write_batch() final;
  void end_write_batch() final;
  void abort_write_batch() final;

  std::unique_ptr< abstract_backend > snapshot() const final;

private:
  map_type& mutable_map();
  iterator make_iterator( iterator_type itr ) const;

  std::shared_ptr< map_type > _map;
  std::shared_ptr< map_type > _batch_snapshot;
  bool _read_only = false;
};

} // namespace diffdb::storage::backends::map
