#pragma once

#include <core/types.hpp>
#include <prettifier/format_registry.hpp>

// Register the json and diff detector/renderer pairs that are enabled,
// at their configured priorities.
void register_builtin_formats(FormatRegistry& registry, const BuiltinFormatsConfig& formats);
