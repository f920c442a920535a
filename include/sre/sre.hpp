#pragma once

/// @file sre.hpp
/// @brief Umbrella header for the song ranking engine core.

#include "sre/core/result.hpp"
#include "sre/version.hpp"
