#include "sqlite_iterator.hpp"
#include "statement.hpp"

#include <stdexcept>

namespace diffdb::storage::backends::sqlite {

namespace {

std::optional< sqlite_iterator::value_type > fetch( statement& stmt )
{
  if( !stmt.step() )
    return {};

  return sqlite_iterator::value_type( stmt.column_blob( 0 ), stmt.column_blob( 1 ) );
}

} // namespace

sqlite_iterator::sqlite_iterator( sqlite3* db, std::optional< value_type > current ):
    _db( db ),
    _current( std::move( current ) )
{}

sqlite_iterator::~sqlite_iterator() {}

const sqlite_iterator::value_type& sqlite_iterator::operator*() const
{
  if( !valid() )
    throw std::runtime_error( "iterator operation is invalid" );

  return *_current;
}

abstract_iterator& sqlite_iterator::operator++()
{
  if( !valid() )
    throw std::runtime_error( "iterator operation is invalid" );

  auto next = seek( _db, _current->first, false );
  _current.reset();
  if( next )
    _current.emplace( next->first, std::move( next->second ) );

  return *this;
}

std::optional< sqlite_iterator::value_type > sqlite_iterator::first( sqlite3* db )
{
  statement stmt( db, "SELECT key, value FROM kv ORDER BY key LIMIT 1" );
  return fetch( stmt );
}

std::optional< sqlite_iterator::value_type >
sqlite_iterator::seek( sqlite3* db, const std::vector< std::byte >& key, bool inclusive )
{
  statement stmt( db,
                  inclusive ? "SELECT key, value FROM kv WHERE key >= ?1 ORDER BY key LIMIT 1"
                            : "SELECT key, value FROM kv WHERE key > ?1 ORDER BY key LIMIT 1" );
  stmt.bind( 1, key );
  return fetch( stmt );
}

bool sqlite_iterator::valid() const
{
  return _current.has_value();
}

std::unique_ptr< abstract_iterator > sqlite_iterator::copy() const
{
  return std::make_unique< sqlite_iterator >( _db, _current );
}

} // namespace diffdb::storage::backends::sqlite
