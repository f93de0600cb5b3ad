#include <diffdb/storage/transaction.hpp>

#include <diffdb/storage/backends/map/map_backend.hpp>
#include <diffdb/storage/error.hpp>

#include <algorithm>

namespace diffdb::storage {

namespace {

bool starts_with( const std::vector< std::byte >& key, const std::vector< std::byte >& prefix )
{
  return key.size() >= prefix.size() && std::equal( prefix.begin(), prefix.end(), key.begin() );
}

} // namespace

transaction::transaction( access_key, std::unique_ptr< backends::abstract_backend > snapshot ):
    _snapshot( std::move( snapshot ) ),
    _backend( *_snapshot )
{}

transaction::transaction( access_key,
                          backends::abstract_backend& backend,
                          std::unique_lock< std::mutex > writer,
                          std::shared_mutex& publish,
                          std::atomic< std::thread::id >& writer_thread ):
    _backend( backend ),
    _writes( std::make_unique< backends::map::map_backend >() ),
    _writer( std::move( writer ) ),
    _publish( &publish ),
    _writer_thread( &writer_thread ),
    _writable( true )
{
  _writer_thread->store( std::this_thread::get_id() );
}

transaction::~transaction()
{
  rollback();
}

bool transaction::writable() const noexcept
{
  return _writable;
}

bool transaction::is_open() const noexcept
{
  return _open;
}

void transaction::check_open() const
{
  if( !_open )
    throw storage_error( storage_errc::transaction_closed );
}

void transaction::check_writable() const
{
  check_open();

  if( !_writable )
    throw storage_error( storage_errc::read_only_transaction );
}

void transaction::check_region( const region& r ) const
{
  if( !read( r.catalog_key() ) )
    throw storage_error( storage_errc::region_not_found, r.to_string() );
}

std::optional< std::vector< std::byte > > transaction::read( const std::vector< std::byte >& key ) const
{
  if( _writes )
  {
    if( auto value = _writes->get( key ); value )
      return value;
  }

  if( _removed.contains( key ) )
    return {};

  return _backend.get( key );
}

void transaction::write( std::vector< std::byte > key, std::vector< std::byte > value )
{
  _removed.erase( key );
  _writes->put( std::move( key ), std::move( value ) );
}

void transaction::erase( const std::vector< std::byte >& key )
{
  _writes->remove( key );
  _removed.insert( key );
}

void transaction::erase_prefix( const std::vector< std::byte >& prefix )
{
  for( auto itr = _backend.lower_bound( prefix ); itr != _backend.end() && starts_with( itr->first, prefix ); ++itr )
    _removed.insert( itr->first );

  std::vector< std::vector< std::byte > > staged;
  for( auto itr = _writes->lower_bound( prefix ); itr != _writes->end() && starts_with( itr->first, prefix ); ++itr )
    staged.push_back( itr->first );

  for( const auto& key: staged )
    _writes->remove( key );
}

std::optional< entry > transaction::seek( const std::vector< std::byte >& key, bool inclusive ) const
{
  auto skip = [ & ]( const std::vector< std::byte >& k )
  {
    return ( !inclusive && k == key ) || _removed.contains( k );
  };

  auto end = _backend.end();
  auto itr = _backend.lower_bound( key );
  while( itr != end && skip( itr->first ) )
    ++itr;

  std::optional< entry > staged;
  if( _writes )
  {
    auto staged_itr = _writes->lower_bound( key );
    if( staged_itr != _writes->end() && !inclusive && staged_itr->first == key )
      ++staged_itr;

    if( staged_itr != _writes->end() )
      staged.emplace( staged_itr->first, staged_itr->second );
  }

  if( itr == end )
    return staged;

  // Staged writes shadow the committed value of the same key
  if( staged && staged->first <= itr->first )
    return staged;

  return entry( itr->first, itr->second );
}

std::optional< entry > transaction::seek_in( const region& r, const std::vector< std::byte >& key, bool inclusive ) const
{
  const auto prefix = r.prefix();
  auto result       = seek( key, inclusive );

  if( !result || !starts_with( result->first, prefix ) )
    return {};

  result->first.erase( result->first.begin(), result->first.begin() + static_cast< std::ptrdiff_t >( prefix.size() ) );
  return result;
}

std::optional< std::vector< std::byte > > transaction::get( const region& r, std::span< const std::byte > key ) const
{
  check_open();
  check_region( r );
  return read( r.make_key( key ) );
}

void transaction::put( const region& r, std::span< const std::byte > key, std::vector< std::byte > value )
{
  check_writable();
  check_region( r );
  write( r.make_key( key ), std::move( value ) );
}

void transaction::remove( const region& r, std::span< const std::byte > key )
{
  check_writable();
  check_region( r );
  erase( r.make_key( key ) );
}

std::optional< entry > transaction::first( const region& r ) const
{
  check_open();
  check_region( r );
  return seek_in( r, r.prefix(), true );
}

std::optional< entry > transaction::next( const region& r, std::span< const std::byte > key ) const
{
  check_open();
  check_region( r );
  return seek_in( r, r.make_key( key ), false );
}

std::uint64_t transaction::count( const region& r ) const
{
  std::uint64_t n = 0;

  for( auto e = first( r ); e; e = seek_in( r, r.make_key( e->first ), false ) )
    ++n;

  return n;
}

void transaction::create_region( const region& r )
{
  check_writable();

  if( auto parent = r.parent(); parent && !region_exists( *parent ) )
    create_region( *parent );

  if( !region_exists( r ) )
    write( r.catalog_key(), {} );
}

void transaction::remove_region( const region& r )
{
  check_writable();
  check_region( r );

  erase_prefix( r.subtree_prefix() );
  erase_prefix( r.catalog_subtree_prefix() );
}

bool transaction::region_exists( const region& r ) const
{
  check_open();
  return read( r.catalog_key() ).has_value();
}

std::vector< region > transaction::regions() const
{
  check_open();

  const auto prefix = region::catalog_prefix();
  std::vector< region > result;

  for( auto e = seek( prefix, true ); e && starts_with( e->first, prefix ); e = seek( e->first, false ) )
  {
    if( auto r = region::from_catalog_key( e->first ); r )
      result.push_back( std::move( *r ) );
  }

  return result;
}

void transaction::commit()
{
  check_open();

  if( _writable )
  {
    // Snapshots are not taken while a batch is half applied
    std::unique_lock publish( *_publish );
    _backend.start_write_batch();

    try
    {
      for( const auto& key: _removed )
        _backend.remove( key );

      for( auto itr = _writes->begin(); itr != _writes->end(); ++itr )
        _backend.put( std::vector< std::byte >( itr->first ), std::vector< std::byte >( itr->second ) );

      _backend.end_write_batch();
    }
    catch( ... )
    {
      _backend.abort_write_batch();
      throw;
    }
  }

  rollback();
}

void transaction::rollback() noexcept
{
  if( !_open )
    return;

  _open = false;

  _writes.reset();
  _removed.clear();
  _snapshot.reset();

  if( _writer.owns_lock() )
  {
    _writer_thread->store( std::thread::id() );
    _writer.unlock();
  }
}

} // namespace diffdb::storage
