#pragma once

#include <string>
#include <system_error>

namespace diffdb::storage {

enum class storage_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  database_not_open,
  database_already_open,
  backend_failure,
  transaction_closed,
  read_only_transaction,
  region_not_found,
  write_in_progress
};

const std::error_category& storage_category() noexcept;

std::error_code make_error_code( storage_errc e );

/**
 * Storage reports failures by throwing, the differential layer turns them
 * back into error codes at its public boundary.
 */
class storage_error final: public std::system_error
{
public:
  explicit storage_error( storage_errc e );
  storage_error( storage_errc e, const std::string& what );
};

} // namespace diffdb::storage

template<>
struct std::is_error_code_enum< diffdb::storage::storage_errc >: public std::true_type
{};
