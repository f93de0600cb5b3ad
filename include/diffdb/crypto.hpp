#pragma once

#include <diffdb/crypto/error.hpp>
#include <diffdb/crypto/fingerprint.hpp>
