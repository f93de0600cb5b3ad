// NOLINTBEGIN

#include <test/fixture.hpp>

#include <boost/filesystem.hpp>

#include <diffdb/log.hpp>

namespace test {

fixture::fixture( const std::string& name, const std::string& log_level )
{
  diffdb::log::initialize();
  diffdb::log::set_level( log_level );

  _state_dir = std::filesystem::temp_directory_path() / ( name + "-" + boost::filesystem::unique_path().string() );
  LOG_INFO( diffdb::log::instance(), "Using temporary directory: {}", _state_dir.string() );
  std::filesystem::create_directory( _state_dir );
}

fixture::~fixture()
{
  std::error_code ec;
  std::filesystem::remove_all( _state_dir, ec );
  if( ec )
    LOG_WARNING( diffdb::log::instance(), "Unable to remove temporary directory {}: {}", _state_dir.string(), ec.message() );
}

std::filesystem::path fixture::database_path( const std::string& file ) const
{
  return _state_dir / file;
}

} // namespace test

// NOLINTEND
