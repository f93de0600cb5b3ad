#pragma once

#include <diffdb/storage/region.hpp>
#include <diffdb/storage/transaction.hpp>
#include <diffdb/storage/types.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace diffdb::storage {

/**
 * A single region seen through a transaction.
 */
class bucket final
{
public:
  bucket( transaction& trx, region r );

  const region& location() const noexcept;
  bool writable() const noexcept;

  std::optional< std::vector< std::byte > > get( std::span< const std::byte > key ) const;
  std::optional< std::vector< std::byte > > get( std::string_view key ) const;

  void put( std::span< const std::byte > key, std::vector< std::byte > value );
  void put( std::string_view key, std::vector< std::byte > value );

  void remove( std::span< const std::byte > key );
  void remove( std::string_view key );

  std::uint64_t count() const;

  /**
   * Visits entries in ascending key order until fn returns false.
   */
  void for_each( const std::function< bool( const entry& ) >& fn ) const;

private:
  transaction& _trx;
  region _region;
};

} // namespace diffdb::storage
