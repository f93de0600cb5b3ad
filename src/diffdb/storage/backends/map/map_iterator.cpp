#include "map_iterator.hpp"

#include <stdexcept>

namespace diffdb::storage::backends::map {

map_iterator::map_iterator( std::unique_ptr< iterator_type > itr, std::shared_ptr< const map_type > map ):
    _itr( std::move( itr ) ),
    _map( std::move( map ) )
{}

map_iterator::~map_iterator() {}

const std::pair< const std::vector< std::byte >, std::vector< std::byte > >& map_iterator::operator*() const
{
  if( !valid() )
    throw std::runtime_error( "iterator operation is invalid" );

  return **_itr;
}

abstract_iterator& map_iterator::operator++()
{
  if( !valid() )
    throw std::runtime_error( "iterator operation is invalid" );

  ++( *_itr );
  return *this;
}

bool map_iterator::valid() const
{
  return *_itr != _map->end();
}

std::unique_ptr< abstract_iterator > map_iterator::copy() const
{
  return std::make_unique< map_iterator >( std::make_unique< iterator_type >( *_itr ), _map );
}

} // namespace diffdb::storage::backends::map
