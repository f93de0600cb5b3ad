#pragma once

#include <map>
#include <vector>

namespace diffdb::storage::backends::map {

using map_type      = std::map< std::vector< std::byte >, std::vector< std::byte > >;
using iterator_type = map_type::const_iterator;

} // namespace diffdb::storage::backends::map
