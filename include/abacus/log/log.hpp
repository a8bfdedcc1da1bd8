#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <abacus/log/formatter.hpp>
#include <abacus/log/frontend.hpp>

namespace abacus::log {

void initialize() noexcept;
logger* instance() noexcept;

// Accepts quill level names such as "debug", "info" or "warning"
bool set_level( std::string_view level ) noexcept;

} // namespace abacus::log
