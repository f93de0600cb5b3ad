#pragma once

#include <diffdb/memory/memory.hpp>
