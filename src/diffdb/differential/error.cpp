#include <diffdb/differential/error.hpp>

#include <diffdb/encode.hpp>

#include <format>
#include <span>
#include <string>
#include <utility>

namespace diffdb {

struct _differential_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "differential";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< differential_errc >( condition ) )
    {
      case differential_errc::ok:
        return "ok"s;
      case differential_errc::conflicting_identity:
        return "multiple objects with the same identity were added in the same cycle"s;
      case differential_errc::invalid_identity:
        return "identity must not be empty"s;
      case differential_errc::collection_not_found:
        return "collection not found"s;
      case differential_errc::apply_failed:
        return "one or more changes failed to apply"s;
      case differential_errc::cancelled:
        return "apply was cancelled"s;
    }
    std::unreachable();
  }
};

const std::error_category& differential_category() noexcept
{
  static _differential_category category;
  return category;
}

std::error_code make_error_code( differential_errc e )
{
  return std::error_code( static_cast< int >( e ), differential_category() );
}

apply_error::apply_error( std::error_code code ):
    _code( code )
{}

apply_error::apply_error( std::vector< apply_failure > failures, bool cancelled ):
    _code( failures.empty() && cancelled ? differential_errc::cancelled : differential_errc::apply_failed ),
    _failures( std::move( failures ) ),
    _cancelled( cancelled )
{}

std::error_code apply_error::code() const noexcept
{
  return _code;
}

const std::vector< apply_failure >& apply_error::failures() const noexcept
{
  return _failures;
}

bool apply_error::cancelled() const noexcept
{
  return _cancelled;
}

std::string apply_error::message() const
{
  const auto count = _failures.size() + ( _cancelled ? 1 : 0 );

  if( count == 0 )
    return _code.message();

  std::string msg = std::format( "{} {} occurred:\n", count, count == 1 ? "error" : "errors" );

  for( const auto& failure: _failures )
    msg += std::format( "\t* {}: {}\n", encode::to_hex( std::span( failure.id ) ), failure.error.message() );

  if( _cancelled )
    msg += std::format( "\t* {}\n", make_error_code( differential_errc::cancelled ).message() );

  return msg;
}

} // namespace diffdb
