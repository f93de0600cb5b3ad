#pragma once

#include <diffdb/storage/backends/iterator.hpp>

#include "types.hpp"

#include <map>
#include <memory>
#include <vector>

namespace diffdb::storage::backends::map {

/**
 * Keeps the map it points into alive, so an iterator over a snapshot stays
 * valid after the backend moves on to a new copy.
 */
class map_iterator final: public abstract_iterator
{
public:
  map_iterator( const map_iterator& )            = delete;
  map_iterator( map_iterator&& )                 = delete;
  map_iterator& operator=( const map_iterator& ) = delete;
  map_iterator& operator=( map_iterator&& )      = delete;
  map_iterator( std::unique_ptr< iterator_type > itr, std::shared_ptr< const map_type > map );
  ~map_iterator() final;

  const std::pair< const std::vector< std::byte >, std::vector< std::byte > >& operator*() const override;

  abstract_iterator& operator++() override;

private:
  bool valid() const override;
  std::unique_ptr< abstract_iterator > copy() const override;

  std::unique_ptr< iterator_type > _itr;
  std::shared_ptr< const map_type > _map;
};

} // namespace diffdb::storage::backends::map
