#include <diffdb/storage/bucket.hpp>

#include <diffdb/memory.hpp>

namespace diffdb::storage {

bucket::bucket( transaction& trx, region r ):
    _trx( trx ),
    _region( std::move( r ) )
{}

const region& bucket::location() const noexcept
{
  return _region;
}

bool bucket::writable() const noexcept
{
  return _trx.writable();
}

std::optional< std::vector< std::byte > > bucket::get( std::span< const std::byte > key ) const
{
  return _trx.get( _region, key );
}

std::optional< std::vector< std::byte > > bucket::get( std::string_view key ) const
{
  return get( memory::as_bytes( key ) );
}

void bucket::put( std::span< const std::byte > key, std::vector< std::byte > value )
{
  _trx.put( _region, key, std::move( value ) );
}

void bucket::put( std::string_view key, std::vector< std::byte > value )
{
  put( memory::as_bytes( key ), std::move( value ) );
}

void bucket::remove( std::span< const std::byte > key )
{
  _trx.remove( _region, key );
}

void bucket::remove( std::string_view key )
{
  remove( memory::as_bytes( key ) );
}

std::uint64_t bucket::count() const
{
  return _trx.count( _region );
}

void bucket::for_each( const std::function< bool( const entry& ) >& fn ) const
{
  for( auto e = _trx.first( _region ); e; e = _trx.next( _region, e->first ) )
  {
    if( !fn( *e ) )
      break;
  }
}

} // namespace diffdb::storage
