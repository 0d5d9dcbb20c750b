#pragma once

#include <string>

namespace storyflow {

// ============================================================================
// Core Types
// ============================================================================

// Scope that owns a set of flags and template lines (a dungeon, a chapter...).
using ContainerId = std::string;

// Flags are always numeric.
using FlagValue = double;

// Separator between a container id and a flag or template id ("crypt.gold").
static constexpr char kPathSeparator = '.';

} // namespace storyflow
