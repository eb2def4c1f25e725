/**
 * @file platform.hpp
 * @brief Socket type definitions and includes.
 *
 * FreeProbe targets POSIX systems (the credential store relies on POSIX
 * permissions), so only the BSD socket API is wrapped here.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace freeprobe {
namespace net {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocket(SocketHandle s) { ::close(s); }

}  // namespace net
}  // namespace freeprobe
