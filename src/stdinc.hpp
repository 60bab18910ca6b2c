#pragma once

// Precompiled header for the library, examples and testcases
#include "junction/utils.hpp"
