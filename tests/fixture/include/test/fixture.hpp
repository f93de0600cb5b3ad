#pragma once

#include <filesystem>
#include <string>

namespace test {

/**
 * Starts logging and owns a unique temporary directory that is removed when
 * the fixture is destroyed.
 */
struct fixture
{
  fixture( const fixture& )            = delete;
  fixture( fixture&& )                 = delete;
  fixture& operator=( const fixture& ) = delete;
  fixture& operator=( fixture&& )      = delete;
  fixture( const std::string& name, const std::string& log_level );
  ~fixture();

  std::filesystem::path database_path( const std::string& file = "diffdb.sqlite" ) const;

  std::filesystem::path _state_dir;
};

} // namespace test
