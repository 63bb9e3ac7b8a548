/* Flow-Ctl: Control server
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "ctl/common.hpp"

namespace ctl::session
{

// Types.

/**
 * The target platform whose conventions select the identity-resolution strategy (see make_identity_resolver())
 * and the permission policy (see compute_permissions()).  Normally native_platform(); but it is a value, not
 * a compile-time switch, so that it can be overridden by configuration (see Server_config) and so that all
 * policies can be exercised on any build host.
 *
 * Only three behaviors are actually distinguished:
 *   - #S_WINDOWS: clients come in over named pipes; identities are resolved from the pipe's client process;
 *     only one local user may use the server at a time; the daemon runs attached to an interactive session,
 *     so it resets the backend when its last client goes away (see resets_on_idle()).
 *   - #S_JS: embedded/browser-style environment with no real process boundary; everything is permitted.
 *   - everything else: clients come in over Unix domain sockets; permissions derive from the peer's OS
 *     credentials.
 */
enum class Platform
{
  /// Windows: named pipes.
  S_WINDOWS = 1,
  /// Embedded/browser (WebAssembly/JavaScript) host: no process boundary.
  S_JS,
  /// Linux: Unix domain sockets.
  S_LINUX,
  /// macOS: Unix domain sockets.
  S_DARWIN,
  /// FreeBSD: Unix domain sockets.
  S_FREEBSD,
  /// OpenBSD: Unix domain sockets.
  S_OPENBSD,
  /// SENTINEL: Not a platform.  I/O use only.
  S_END_SENTINEL
}; // enum class Platform

// Free functions.

/**
 * The Platform this binary was built for.
 * @return See above.
 */
constexpr Platform native_platform()
{
#if defined(_WIN32)
  return Platform::S_WINDOWS;
#elif defined(__EMSCRIPTEN__)
  return Platform::S_JS;
#elif defined(__APPLE__)
  return Platform::S_DARWIN;
#elif defined(__FreeBSD__)
  return Platform::S_FREEBSD;
#elif defined(__OpenBSD__)
  return Platform::S_OPENBSD;
#else
  return Platform::S_LINUX;
#endif
}

/**
 * Whether clients on the given platform connect over named pipes, so that their identity must be resolved
 * from the pipe's client process (as opposed to from socket peer credentials).
 *
 * @param platform
 *        Platform.
 * @return See above.
 */
bool uses_pipe_identity(Platform platform);

/**
 * Whether the daemon on the given platform is expected to run attached to an interactively logged-in session
 * (as opposed to a headless service), and hence should reset its backend each time the last active request
 * completes (unless the backend is in server mode).
 *
 * @param platform
 *        Platform.
 * @return See above.
 */
bool resets_on_idle(Platform platform);

/**
 * Serializes a Platform as its lower-case identifier, such as `linux`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Platform val);

/**
 * Deserializes a Platform from its identifier as printed by `operator<<` (case-insensitive) or numeric value.
 * Anything else yields Platform::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to read.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Platform& val);

} // namespace ctl::session
