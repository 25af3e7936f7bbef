#ifndef E521_PRECOMPILED_H
#define E521_PRECOMPILED_H

#ifndef __STDC_FORMAT_MACROS
#define __STDC_FORMAT_MACROS
#endif
#include <inttypes.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <cxxabi.h>
#include <dlfcn.h>
#include <unwind.h>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/err.h>

#endif  // E521_PRECOMPILED_H
