#pragma once

// Platform detection and portable type aliases for the system layer.
//
//   DEADSIMPLE_LINUX   – defined on Linux
//   NativeHandle       – the OS handle type for sockets / file descriptors
//   kInvalidHandle     – sentinel value representing an invalid handle

#ifdef __linux__
#define DEADSIMPLE_LINUX
#else
#error "Unsupported platform – deadsimple currently supports Linux only"
#endif

namespace deadsimple {

using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

}  // namespace deadsimple
