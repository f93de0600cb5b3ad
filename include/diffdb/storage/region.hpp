#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace diffdb::storage {

/**
 * A named nested key space, addressed by its path from the root.
 *
 * Keys of a region are stored as
 *   0x01 | segment... | 0x00 | item key
 * and the region itself is recorded in the catalog under
 *   0x00 | segment... | 0x00
 * where each segment is 0x01 | u32 big-endian length | name. Items of a
 * region sort together and never interleave with items of a child region.
 */
class region final
{
public:
  explicit region( std::string_view name );

  region child( std::string_view name ) const;
  std::optional< region > parent() const;

  const std::vector< std::string >& path() const noexcept;
  const std::string& name() const noexcept;
  std::string to_string() const;

  /**
   * Prefix shared by every item key in this region.
   */
  std::vector< std::byte > prefix() const;

  /**
   * Prefix shared by item keys of this region and all of its descendants.
   */
  std::vector< std::byte > subtree_prefix() const;

  /**
   * Prefix shared by catalog entries of this region and its descendants.
   */
  std::vector< std::byte > catalog_subtree_prefix() const;

  std::vector< std::byte > make_key( std::span< const std::byte > key ) const;
  std::vector< std::byte > catalog_key() const;

  static std::vector< std::byte > catalog_prefix();
  static std::optional< region > from_catalog_key( std::span< const std::byte > key );

  bool operator==( const region& ) const = default;

private:
  region() = default;

  std::vector< std::string > _path;
};

} // namespace diffdb::storage
