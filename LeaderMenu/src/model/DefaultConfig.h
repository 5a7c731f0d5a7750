#pragma once

#include <string_view>

namespace lmenu {

// Seed document written when no config file exists yet.
std::string_view defaultConfigDocument() noexcept;

} // namespace lmenu
