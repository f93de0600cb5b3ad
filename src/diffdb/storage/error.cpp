#include <diffdb/storage/error.hpp>

#include <string>
#include <utility>

namespace diffdb::storage {

struct _storage_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "storage";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< storage_errc >( condition ) )
    {
      case storage_errc::ok:
        return "ok"s;
      case storage_errc::database_not_open:
        return "database is not open"s;
      case storage_errc::database_already_open:
        return "database is already open"s;
      case storage_errc::backend_failure:
        return "storage backend failure"s;
      case storage_errc::transaction_closed:
        return "transaction is closed"s;
      case storage_errc::read_only_transaction:
        return "cannot write in a read only transaction"s;
      case storage_errc::region_not_found:
        return "region not found"s;
      case storage_errc::write_in_progress:
        return "a writable transaction is already open on this thread"s;
    }
    std::unreachable();
  }
};

const std::error_category& storage_category() noexcept
{
  static _storage_category category;
  return category;
}

std::error_code make_error_code( storage_errc e )
{
  return std::error_code( static_cast< int >( e ), storage_category() );
}

storage_error::storage_error( storage_errc e ):
    std::system_error( make_error_code( e ) )
{}

storage_error::storage_error( storage_errc e, const std::string& what ):
    std::system_error( make_error_code( e ), what )
{}

} // namespace diffdb::storage
