#include <diffdb/codec/codec.hpp>
#include <diffdb/log.hpp>

namespace diffdb::codec {

namespace detail {

void report_failure( std::string_view operation, const std::exception& e ) noexcept
{
  LOG_WARNING( diffdb::log::instance(), "Codec {} failed: {}", operation, e.what() );
}

} // namespace detail

decoder::decoder( std::span< const std::byte > data ) noexcept:
    _data( data )
{}

std::span< const std::byte > decoder::data() const noexcept
{
  return _data;
}

} // namespace diffdb::codec
