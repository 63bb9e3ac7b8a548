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

#include <ipc/util/process_credentials.hpp>
#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/filesystem.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/**
 * Catch-all namespace for Flow-Ctl: the local control server of a networking daemon.  Local clients (CLI tools,
 * GUI front-ends) connect over OS-local channels (unix domain sockets; named pipes on Windows) and talk to the
 * daemon's backend through it.
 *
 * Modules:
 *   - ctl::session: who is on the other end of each connection (Identity_resolver), what they may do
 *     (compute_permissions()), and the single-active-user session tracking that guards the backend against
 *     leaking one local user's state to another (Session_tracker, Control_server).
 *   - ctl::transport: a concrete Unix-domain-socket listener/connection pair speaking HTTP/1.1, plugging into
 *     the ctl::session::Listener and ctl::session::Conn seams.
 *
 * Error reporting follows the boost.system/Flow convention used in Flow-IPC: fallible APIs take a trailing
 * `Error_code* err_code = 0`; if null, a truthy result is thrown as `flow::error::Runtime_error` instead.
 */
namespace ctl
{

// Types.

/// Short-hand for boost.system error code; used in all our APIs.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic function object, as in Flow.
template<typename Signature>
using Function = flow::Function<Signature>;

/// Short-hand for the file system module.
namespace fs = boost::filesystem;

/**
 * The `flow::log::Component` payloads used by all Flow-Ctl logging.  Register with a `flow::log::Config` via
 * S_CTL_LOG_COMPONENT_NAME_MAP to get per-component verbosity control and readable component names.
 */
enum class Log_component
{
  /// Anything not covered by another component.
  S_UNCAT = 0,
  /// ctl::session: identity, permissions, session tracking, server lifecycle.
  S_SESSION,
  /// ctl::transport: local listener and connections.
  S_TRANSPORT,
  /// SENTINEL: Not a component.
  S_END_SENTINEL
}; // enum class Log_component

// Constants.

/// Log_component name map, suitable for `flow::log::Config::init_component_names()`.
extern const boost::unordered_multimap<Log_component, std::string> S_CTL_LOG_COMPONENT_NAME_MAP;

} // namespace ctl

/**
 * Small, general-purpose aliases shared by Flow-Ctl modules; mostly re-exports of Flow and Flow-IPC Core
 * utility types under one roof.
 */
namespace ctl::util
{

// Types.

using flow::util::String_view;
using flow::Fine_duration;

/// The credentials (PID, UID, GID) of a process, as reported by the OS for a local socket peer.
using ::ipc::util::Process_credentials;
/// Process ID (PID).
using ::ipc::util::process_id_t;
/// User ID (UID).
using ::ipc::util::user_id_t;
/// Group ID (GID).
using ::ipc::util::group_id_t;

/// Native named-pipe handle (a `HANDLE` in Windows terms); opaque elsewhere.
using pipe_handle_t = void*;

} // namespace ctl::util
