#pragma once

#include <diffdb/storage/bucket.hpp>
#include <diffdb/storage/database.hpp>
#include <diffdb/storage/error.hpp>
#include <diffdb/storage/region.hpp>
#include <diffdb/storage/transaction.hpp>
