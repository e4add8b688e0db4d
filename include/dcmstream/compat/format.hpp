/**
 * @file format.hpp
 * @brief std::format when the standard library has it, {fmt} otherwise
 *
 * libstdc++ only ships <format> from GCC 13, so older toolchains route
 * dcmstream::compat::format to fmt::format.
 *
 *   auto s = dcmstream::compat::format("tag {} at {}", tag.to_string(), pos);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define DCMSTREAM_HAS_STD_FORMAT 1
#elif defined(_MSC_VER) && _MSC_VER >= 1929 && defined(_HAS_CXX20) && _HAS_CXX20
    #define DCMSTREAM_HAS_STD_FORMAT 1
#else
    #define DCMSTREAM_HAS_STD_FORMAT 0
#endif

#if DCMSTREAM_HAS_STD_FORMAT
    #include <format>
    namespace dcmstream::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace dcmstream::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
