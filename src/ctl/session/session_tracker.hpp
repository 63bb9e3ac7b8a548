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

#include "ctl/session/backend.hpp"
#include <boost/noncopyable.hpp>
#include <boost/unordered_map.hpp>

namespace ctl::session
{

// Types.

/**
 * Registry of the requests currently in flight across all connections of a Control_server, enforcing that all of
 * them belong to one local user at a time, and resetting the backend's per-user state whenever the active user
 * changes.
 *
 * ### States ###
 * Idle (no active requests) -> Active(U) (1+ active requests, all from user U) -> Idle -> ....
 *   - add_active_request() registers a request.  It is refused with error::Code::S_ACCESS_DENIED_OTHER_USER_ACTIVE
 *     if requests from a different user (by Conn_identity::m_user_id) are active; or with
 *     error::Code::S_ACCESS_DENIED_BY_POLICY if Backend::check_connection_allowed() says no.
 *   - When a request with non-empty user ID becomes the only active one, the backend is told the user ID; and if
 *     it differs from the last such user ID (and there was one), the backend is reset -- exactly once per such
 *     transition, before add_active_request() returns, hence before the request's own logic runs.
 *   - remove_active_request() deregisters it.  If that leaves 0 active, and the tracker is in reset-on-idle
 *     mode, the backend is reset unless it is in server mode.
 *
 * Note that on platforms whose identities carry no user ID (empty Conn_identity::m_user_id; see Conn_identity
 * docs) none of the above user-switch logic ever triggers: all identities compare equal.
 *
 * ### Locking ###
 * One mutex guards the active-request map and the last user ID.  Backend::check_connection_allowed() and
 * Backend::set_current_user_id() are called under it; Backend::reset_for_client_disconnect() and
 * Backend::in_server_mode() are not: the decision is made under the lock and acted on after releasing it.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.
 */
class Session_tracker :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Identifies an active request.  0 is never issued.
  using request_id_t = uint64_t;

  /**
   * RAII guard for a registered request: its destructor calls remove_active_request() -- exactly once, however the
   * request's processing ends.
   */
  class Active_request :
    private boost::noncopyable
  {
  public:
    /**
     * Takes over deregistration of a request registered by add_active_request().
     *
     * @param tracker
     *        The tracker; must outlive `*this`.
     * @param id
     *        Value returned by `tracker->add_active_request()`.
     * @param backend
     *        Same as passed to that call.
     */
    explicit Active_request(Session_tracker* tracker, request_id_t id, Backend* backend);

    /// Deregisters the request.
    ~Active_request();

    /**
     * The request ID.
     * @return See above.
     */
    request_id_t id() const;

  private:
    /// See ctor.
    Session_tracker* const m_tracker;

    /// See ctor.
    const request_id_t m_id;

    /// See ctor.
    Backend* const m_backend;
  }; // class Active_request

  // Constructors/destructor.

  /**
   * Constructor.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param reset_on_idle
   *        Whether to reset the backend when the last active request completes (unless the backend is in
   *        server mode).
   */
  explicit Session_tracker(flow::log::Logger* logger_ptr, bool reset_on_idle);

  // Methods.

  /**
   * Registers a request from the given identity, possibly resetting the backend first; see class doc header.
   *
   * @param identity
   *        Identity of the connection; not null.  A ref is held until the request is removed.
   * @param backend
   *        Bound backend; not null.
   * @param denial_msg_or_null
   *        If not null, and registration is refused, set to a human-readable explanation, such as
   *        `"Server already in use by alice, pid 1234"`.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_ACCESS_DENIED_OTHER_USER_ACTIVE, error::Code::S_ACCESS_DENIED_BY_POLICY.
   * @return The request ID to pass to remove_active_request() (or Active_request); 0 on error.
   */
  request_id_t add_active_request(const Conn_identity::Ptr& identity, Backend* backend,
                                  std::string* denial_msg_or_null = 0, Error_code* err_code = 0);

  /**
   * Deregisters a request; see class doc header.
   *
   * @param id
   *        Value from add_active_request().  Unknown IDs are ignored (but still count toward the idle check).
   * @param backend
   *        Same as passed to add_active_request().
   */
  void remove_active_request(request_id_t id, Backend* backend);

  /**
   * Whether a request from `identity` would pass the single-active-user check right now.
   *
   * @param identity
   *        Identity.
   * @param conflict_msg_or_null
   *        If not null, and the result is `false`, set as in add_active_request().
   * @return See above.
   */
  bool check_conn_identity(const Conn_identity& identity, std::string* conflict_msg_or_null = 0) const;

  /**
   * Number of requests registered and not yet removed.
   * @return See above.
   */
  size_t n_active_requests() const;

  /**
   * The user ID of the last request that became the only active one with a non-empty user ID; empty if none yet.
   * @return See above.
   */
  std::string last_user_id() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// What add_active_request_locked() decided: what add_active_request() is to do after releasing the lock.
  struct Add_decision
  {
    /// ID of the registered request; 0 if refused.
    request_id_t m_id = 0;

    /// Whether the backend is to be reset.
    bool m_reset = false;

    /// If #m_reset: the user ID of the session being abandoned.
    std::string m_prev_user_id;
  };

  // Methods.

  /**
   * The locked phase of add_active_request().
   *
   * @param identity
   *        See add_active_request().
   * @param backend
   *        See add_active_request().
   * @param denial_msg_or_null
   *        See add_active_request().
   * @param err_code
   *        See add_active_request(); not null.
   * @return See Add_decision.
   */
  Add_decision add_active_request_locked(const Conn_identity::Ptr& identity, Backend* backend,
                                         std::string* denial_msg_or_null, Error_code* err_code);

  /**
   * check_conn_identity() with #m_mutex already locked.
   *
   * @param identity
   *        See check_conn_identity().
   * @param conflict_msg_or_null
   *        See check_conn_identity().
   * @return See check_conn_identity().
   */
  bool check_conn_identity_locked(const Conn_identity& identity, std::string* conflict_msg_or_null) const;

  // Data.

  /// See ctor.
  const bool m_reset_on_idle;

  /// Protects the data below.
  mutable Mutex m_mutex;

  /// The active requests.
  boost::unordered_map<request_id_t, Conn_identity::Ptr> m_active_requests;

  /// See last_user_id().
  std::string m_last_user_id;

  /// The last request ID issued.
  request_id_t m_last_request_id;
}; // class Session_tracker

} // namespace ctl::session
