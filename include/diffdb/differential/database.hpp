#pragma once

#include <diffdb/differential/differential.hpp>
#include <diffdb/differential/error.hpp>
#include <diffdb/storage/database.hpp>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace diffdb {

/**
 * A differential database file holding any number of named collections.
 *
 * Differentials opened from a database share its storage. They remain valid
 * objects after close(), but their operations fail with database_not_open.
 */
class database final
{
public:
  database();
  database( const database& )            = delete;
  database( database&& )                 = delete;
  database& operator=( const database& ) = delete;
  database& operator=( database&& )      = delete;
  ~database();

  std::error_code open( const std::filesystem::path& path );
  std::error_code open();
  void close();
  bool is_open() const;

  /**
   * Opens the collection name, creating it on first use.
   */
  result< std::shared_ptr< differential > > open_differential( std::string_view name );

  /**
   * Opens the collection name if it exists, collection_not_found otherwise.
   */
  result< std::shared_ptr< differential > > find_differential( std::string_view name ) const;

  /**
   * Deletes the collection name with all of its tracked state.
   */
  std::error_code remove( std::string_view name );

  result< std::vector< std::string > > collections() const;

private:
  std::error_code open_backend( const std::optional< std::filesystem::path >& path );

  std::shared_ptr< storage::database > _db;
};

} // namespace diffdb
