#include <diffdb/crypto/error.hpp>

#include <string>
#include <utility>

namespace diffdb::crypto {

struct _crypto_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "crypto";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< crypto_errc >( condition ) )
    {
      case crypto_errc::ok:
        return "ok"s;
      case crypto_errc::invalid_fingerprint:
        return "invalid fingerprint"s;
    }
    std::unreachable();
  }
};

const std::error_category& crypto_category() noexcept
{
  static _crypto_category category;
  return category;
}

std::error_code make_error_code( crypto_errc e )
{
  return std::error_code( static_cast< int >( e ), crypto_category() );
}

} // namespace diffdb::crypto
