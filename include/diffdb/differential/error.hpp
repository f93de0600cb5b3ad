#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <system_error>
#include <vector>

namespace diffdb {

enum class differential_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  conflicting_identity,
  invalid_identity,
  collection_not_found,
  apply_failed,
  cancelled
};

const std::error_category& differential_category() noexcept;

std::error_code make_error_code( differential_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

/**
 * An item the apply function rejected.
 */
struct apply_failure
{
  std::vector< std::byte > id;
  std::error_code error;
};

/**
 * Every failure encountered during one call to each(), in encounter order.
 *
 * When the scan itself failed (the store could not be read or committed)
 * code() carries that error and failures() is empty.
 */
class apply_error final
{
public:
  explicit apply_error( std::error_code code );
  apply_error( std::vector< apply_failure > failures, bool cancelled );

  std::error_code code() const noexcept;
  const std::vector< apply_failure >& failures() const noexcept;
  bool cancelled() const noexcept;

  std::string message() const;

private:
  std::error_code _code;
  std::vector< apply_failure > _failures;
  bool _cancelled = false;
};

using apply_result = std::expected< void, apply_error >;

} // namespace diffdb

template<>
struct std::is_error_code_enum< diffdb::differential_errc >: public std::true_type
{};
