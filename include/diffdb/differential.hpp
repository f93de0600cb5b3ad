#pragma once

#include <diffdb/differential/database.hpp>
#include <diffdb/differential/differential.hpp>
#include <diffdb/differential/error.hpp>
