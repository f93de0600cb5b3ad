#include "map_backend.hpp"

#include <diffdb/storage/error.hpp>

#include <utility>

namespace diffdb::storage::backends::map {

map_backend::map_backend():
    abstract_backend(),
    _map( std::make_shared< map_type >() )
{}

map_backend::~map_backend() {}

map_type& map_backend::mutable_map()
{
  if( _read_only )
    throw storage_error( storage_errc::read_only_transaction );

  if( _map.use_count() > 1 )
    _map = std::make_shared< map_type >( *_map );

  return *_map;
}

iterator map_backend::make_iterator( iterator_type itr ) const
{
  return iterator( std::make_unique< map_iterator >( std::make_unique< iterator_type >( itr ), _map ) );
}

iterator map_backend::begin() noexcept
{
  return make_iterator( _map->cbegin() );
}

iterator map_backend::end() noexcept
{
  return make_iterator( _map->cend() );
}

iterator map_backend::lower_bound( const std::vector< std::byte >& key )
{
  return make_iterator( std::as_const( *_map ).lower_bound( key ) );
}

void map_backend::put( std::vector< std::byte >&& key, std::vector< std::byte >&& value )
{
  mutable_map().insert_or_assign( std::move( key ), std::move( value ) );
}

std::optional< std::vector< std::byte > > map_backend::get( const std::vector< std::byte >& key ) const
{
  if( auto itr = _map->find( key ); itr != _map->end() )
    return itr->second;

  return {};
}

void map_backend::remove( const std::vector< std::byte >& key )
{
  mutable_map().erase( key );
}

std::uint64_t map_backend::size() const noexcept
{
  return _map->size();
}

void map_backend::start_write_batch()
{
  if( _read_only )
    throw storage_error( storage_errc::read_only_transaction );

  if( _batch_snapshot )
    throw storage_error( storage_errc::backend_failure, "write batch already started" );

  _batch_snapshot = _map;
}

void map_backend::end_write_batch()
{
  if( !_batch_snapshot )
    throw storage_error( storage_errc::backend_failure, "no write batch in progress" );

  _batch_snapshot.reset();
}

void map_backend::abort_write_batch()
{
  if( !_batch_snapshot )
    return;

  _map = std::move( _batch_snapshot );
}

std::unique_ptr< abstract_backend > map_backend::snapshot() const
{
  auto view        = std::make_unique< map_backend >();
  view->_map       = _map;
  view->_read_only = true;
  return view;
}

} // namespace diffdb::storage::backends::map
