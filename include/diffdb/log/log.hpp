#pragma once

#include <quill/LogMacros.h>

#include <diffdb/log/formatter.hpp>
#include <diffdb/log/frontend.hpp>

#include <string_view>

namespace diffdb::log {

void initialize() noexcept;
logger* instance() noexcept;

/**
 * Sets the level of the root logger from its name ("trace", "debug", "info",
 * "warning", "error", "critical"). Returns false for an unknown name.
 */
bool set_level( std::string_view level ) noexcept;

} // namespace diffdb::log
