#pragma once

#include <cstddef>

#include "named_value.hpp"

using PlayerIndex = std::size_t;
using Coord = int;

using PlayerCount = NamedValue<std::size_t, struct _PlayerCountTag>;
using StepCount = NamedValue<std::size_t, struct _StepCountTag>;
using FieldWidth = NamedValue<Coord, struct _FieldWidthTag>;
using FieldHeight = NamedValue<Coord, struct _FieldHeightTag>;
