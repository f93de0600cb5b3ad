#include <diffdb/codec/error.hpp>

#include <string>
#include <utility>

namespace diffdb::codec {

struct _codec_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "codec";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< codec_errc >( condition ) )
    {
      case codec_errc::ok:
        return "ok"s;
      case codec_errc::encode_failure:
        return "failed to encode value"s;
      case codec_errc::decode_failure:
        return "failed to decode value"s;
    }
    std::unreachable();
  }
};

const std::error_category& codec_category() noexcept
{
  static _codec_category category;
  return category;
}

std::error_code make_error_code( codec_errc e )
{
  return std::error_code( static_cast< int >( e ), codec_category() );
}

} // namespace diffdb::codec
