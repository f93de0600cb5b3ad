#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace diffdb::storage {

class region;
class transaction;
class database;

using entry = std::pair< std::vector< std::byte >, std::vector< std::byte > >;

} // namespace diffdb::storage
