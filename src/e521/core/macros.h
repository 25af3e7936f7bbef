#pragma once

#include "precompiled.h"

typedef void* void_ptr;
typedef const char* const_char_ptr;
