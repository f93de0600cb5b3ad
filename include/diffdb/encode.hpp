#pragma once

#include <diffdb/encode/hex.hpp>
