#pragma once

#include <diffdb/storage/database.hpp>
#include <diffdb/storage/region.hpp>
#include <diffdb/storage/transaction.hpp>

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace diffdb::detail {

/**
 * One pass over the pending records of a collection. The scan owns a
 * writable transaction for its whole lifetime and rolls it back unless
 * commit() is reached.
 */
class scan final
{
public:
  scan( storage::database& db,
        const storage::region& pending,
        const storage::region& payloads,
        const storage::region& committed );
  scan( const scan& )            = delete;
  scan( scan&& )                 = delete;
  scan& operator=( const scan& ) = delete;
  scan& operator=( scan&& )      = delete;
  ~scan();

  std::optional< storage::entry > first() const;
  std::optional< storage::entry > next( std::span< const std::byte > id ) const;

  /**
   * Payload staged for id. A pending record without a payload means the
   * store was corrupted and is reported as std::logic_error.
   */
  std::vector< std::byte > payload( std::span< const std::byte > id ) const;

  /**
   * Records fingerprint as committed for id and drops its pending state.
   */
  void promote( std::span< const std::byte > id, std::vector< std::byte > fingerprint );

  void commit();

private:
  std::unique_ptr< storage::transaction > _trx;
  const storage::region& _pending;
  const storage::region& _payloads;
  const storage::region& _committed;
};

} // namespace diffdb::detail
