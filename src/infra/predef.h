#if !defined(_FSEND_INFRA_PREDEF_H_INCLUDED_)
#define _FSEND_INFRA_PREDEF_H_INCLUDED_

#if !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)
#error "Please don't directly #include this file. Instead, #include infra.h"
#endif  // !defined(_FSEND_INFRA_INFRA_H_INCLUDED_)


//
// fsend is built on Linux only: sendfile64(), splice() and pipe sizing
// have no portable equivalent. The build sets PLATFORM_LINUX and one of
// COMPILER_GNU / COMPILER_CLANG.
//
#if !PLATFORM_LINUX
#   error "Unknown platform"
#endif

#if !COMPILER_GNU && !COMPILER_CLANG
#   error "Unknown compiler"
#endif

#if !defined(_GNU_SOURCE)
#   define _GNU_SOURCE 1    // splice(), pipe2(), accept4(), F_SETPIPE_SZ
#endif


// System
#include <sys/sendfile.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <unistd.h>

// C
#include <cctype>
#include <cerrno>
#include <cinttypes>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// C++
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace stdfs = std::filesystem;


// spdlog (and the fmt it carries), without its warnings
#if COMPILER_GNU
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wdeprecated"
#elif COMPILER_CLANG
#   pragma clang diagnostic push
#   pragma clang diagnostic ignored "-Wdeprecated"
#endif

#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#if COMPILER_GNU
#   pragma GCC diagnostic pop
#elif COMPILER_CLANG
#   pragma clang diagnostic pop
#endif


#endif  // !defined(_FSEND_INFRA_PREDEF_H_INCLUDED_)
