#pragma once

#include <cstdlib>

#include "utils/logger.hpp"

#if defined(__GNUC__) || defined(__clang__)
#define IDENT_BUILTIN_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define IDENT_BUILTIN_UNREACHABLE() __assume(false)
#else
#define IDENT_BUILTIN_UNREACHABLE() ((void)0)
#endif

// Макрос для недостижимых веток кода (например, default в switch по закрытому enum)
#define UNREACHABLE(reason)                                                                        \
    do {                                                                                           \
        LOG_CRITICAL << "UNREACHABLE code reached: " << reason;                                    \
        std::abort();                                                                              \
        IDENT_BUILTIN_UNREACHABLE();                                                               \
    } while (0)
