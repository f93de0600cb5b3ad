#pragma once

#include <diffdb/log/log.hpp>
