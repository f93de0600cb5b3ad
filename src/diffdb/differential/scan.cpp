#include "scan.hpp"

#include <diffdb/log.hpp>

#include <stdexcept>

namespace diffdb::detail {

scan::scan( storage::database& db,
            const storage::region& pending,
            const storage::region& payloads,
            const storage::region& committed ):
    _trx( db.begin( true ) ),
    _pending( pending ),
    _payloads( payloads ),
    _committed( committed )
{}

scan::~scan() {}

std::optional< storage::entry > scan::first() const
{
  return _trx->first( _pending );
}

std::optional< storage::entry > scan::next( std::span< const std::byte > id ) const
{
  return _trx->next( _pending, id );
}

std::vector< std::byte > scan::payload( std::span< const std::byte > id ) const
{
  auto data = _trx->get( _payloads, id );

  if( !data )
  {
    LOG_CRITICAL( diffdb::log::instance(),
                  "Pending change for {} in {} has no payload",
                  diffdb::log::hex{ id.data(), id.size() },
                  _pending.to_string() );
    throw std::logic_error( "missing payload for pending change" );
  }

  return std::move( *data );
}

void scan::promote( std::span< const std::byte > id, std::vector< std::byte > fingerprint )
{
  _trx->put( _committed, id, std::move( fingerprint ) );
  _trx->remove( _pending, id );
  _trx->remove( _payloads, id );
}

void scan::commit()
{
  _trx->commit();
}

} // namespace diffdb::detail
