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

#include "ctl/session/conn_identity.hpp"

namespace ctl::session
{

// Types.

/// Options for Backend::start().
struct Start_options
{
  // Data.

  /// Opaque ID identifying the daemon's log stream, for the backend to report upstream; may be empty.
  std::string m_backend_log_id;
}; // struct Start_options

/**
 * The daemon's local backend as seen by Control_server: the object that holds the sensitive per-user session
 * state that the server guards.  The backend's own networking and session logic are out of scope here; this is
 * only the contract Control_server and Session_tracker rely on.
 *
 * ### Locking ###
 * Session_tracker calls check_connection_allowed() and set_current_user_id() while holding its own lock; so
 * these must not call back into Control_server or Session_tracker.  reset_for_client_disconnect() and
 * in_server_mode() are always called with no Flow-Ctl lock held.  The backend's own locks are thus always
 * acquired after the tracker's, never before.
 *
 * ### Thread safety ###
 * All methods may be called concurrently from multiple threads.
 */
class Backend
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Backend();

  // Methods.

  /**
   * Policy check on a newly registering request's identity.
   *
   * @param identity
   *        Identity of the connection; not null.
   * @return Falsy if allowed; otherwise a code whose message explains the rejection.
   */
  virtual Error_code check_connection_allowed(const Conn_identity& identity) = 0;

  /**
   * Informs the backend which user is now the active one.  Invoked when a request with a non-empty
   * Conn_identity::m_user_id becomes the only active request.
   *
   * @param user_id
   *        User ID.
   */
  virtual void set_current_user_id(const std::string& user_id) = 0;

  /**
   * Discards all state that belongs to the previous local user's session.  May take a while.
   */
  virtual void reset_for_client_disconnect() = 0;

  /**
   * Whether the backend is configured to persist across client sessions (so that it must not be reset when the
   * last client goes idle).
   *
   * @return See above.
   */
  virtual bool in_server_mode() = 0;

  /**
   * Whether the backend's configuration is valid so that it can be started.
   *
   * @return See above.
   */
  virtual bool prefs_valid() = 0;

  /**
   * Starts the backend.  Control_server invokes it at most once.
   *
   * @param opts
   *        Options.
   */
  virtual void start(const Start_options& opts) = 0;

  /// Stops the backend.  Control_server invokes it at most once, when its run() returns.
  virtual void shutdown() = 0;

  /**
   * User ID of the daemon's operator, such as a decimal UID; or empty if there is none.
   * @return See above.
   */
  virtual std::string operator_user_id() = 0;

  /**
   * HTML rendering of the backend's status, for the status page.
   * @return See above.
   */
  virtual std::string status_html() = 0;
}; // class Backend

} // namespace ctl::session
