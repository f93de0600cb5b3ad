#pragma once

#include <diffdb/codec/codec.hpp>
#include <diffdb/codec/error.hpp>
