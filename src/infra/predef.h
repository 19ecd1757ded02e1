#if !defined(_LACQ_INFRA_PREDEF_H_INCLUDED_)
#define _LACQ_INFRA_PREDEF_H_INCLUDED_

#if !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_LACQ_INFRA_INFRA_H_INCLUDED_)


//
// Make sure one of the following is true:
//
//  PLATFORM_LINUX
//  PLATFORM_MACOS
//
#if PLATFORM_LINUX
//  Build on Linux
#elif PLATFORM_MACOS
//  Build on macOS
#else
#   error "Unknown platform"
#endif


//
// Define some macros
//
#if PLATFORM_LINUX

#   if !defined(_GNU_SOURCE)
#       define _GNU_SOURCE 1
#   endif

#elif PLATFORM_MACOS

#   if !defined(_DARWIN_C_SOURCE)
#       define _DARWIN_C_SOURCE 1
#   endif

#else
#   error "Unknown platform"

#endif


//
// Header files
//
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>


//
// Standard C headers
//
#include <cerrno>
#include <cinttypes>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>


//
// Common C++ headers
//
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>


#if __has_include(<filesystem>)
#   include <filesystem>
    namespace stdfs = std::filesystem;
#elif __has_include(<experimental/filesystem>)
#   include <experimental/filesystem>
    namespace stdfs = std::experimental::filesystem;
#else
#   error "Can't find C++ filesystem implementation"
#endif


//
// Third-party headers
//

// Push: disable specific warnings for third-party libraries
#if COMPILER_GNU
#   pragma GCC diagnostic push

//  warning: implicit capture of 'this' via '[=]' is deprecated in C++20 [-Wdeprecated]
#   pragma GCC diagnostic ignored "-Wdeprecated"

#elif COMPILER_CLANG
#   pragma clang diagnostic push

//  See https://clang.llvm.org/docs/DiagnosticsReference.html#wdeprecated
#   pragma clang diagnostic ignored "-Wdeprecated"

#else
#   error "Unknown compiler"
#endif


// CLI11
#include <CLI/CLI.hpp>

// spdlog
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

// cereal
#include <cereal/cereal.hpp>
#include <cereal/access.hpp>
#include <cereal/archives/json.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>


// Pop: restore specific warnings for third-party libraries
#if COMPILER_GNU
#   pragma GCC diagnostic pop

#elif COMPILER_CLANG
#   pragma clang diagnostic pop

#else
#   error "Unknown compiler"
#endif


#endif  // !defined(_LACQ_INFRA_PREDEF_H_INCLUDED_)
