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

#include "ctl/session/api_handler.hpp"
#include "ctl/session/cancellation.hpp"
#include "ctl/session/identity_resolver.hpp"
#include "ctl/session/server_config.hpp"
#include "ctl/session/session_tracker.hpp"
#include <atomic>
#include <mutex>

namespace ctl::session
{

// Types.

/**
 * The daemon's local control server: accepts connections from local clients through a Listener, resolves who
 * each one is, admits their requests one local user at a time, and routes them -- most importantly to the local
 * API (Api_handler) with the permissions the requester's identity warrants.
 *
 * ### Lifecycle ###
 * Two independent steps, in either order:
 *   - bind_backend() sets the Backend, exactly once.  Binding a null backend, or binding twice, is a programming
 *     error and aborts the program.
 *   - run() serves until the listener fails or the given Cancellation fires.
 *
 * The backend is started (Backend::start()) exactly once, as soon as run() has been called, a backend is bound, and
 * Backend::prefs_valid() is `true` -- checked at both steps.  When run() returns, a bound backend is shut down
 * (Backend::shutdown()), once.
 *
 * ### Serving ###
 * Each accepted Conn is served by its own thread (a `flow::async::Single_thread_task_loop`), so neither the accept
 * loop nor any other connection ever waits on identity resolution, backend resets, idle keep-alive clients, or
 * long-running API calls.  In that thread, the Conn's
 * identity is resolved once (see Identity_resolver); then its requests are read and answered in sequence (keep-alive
 * connections may carry several; each Conn closes after Server_config::m_conn_idle_timeout without a request).  For
 * each request see handle_request() for the routing; every request admitted there is an active request in the
 * sense of Session_tracker for exactly as long as it is being handled.
 *
 * ### Thread safety ###
 * bind_backend(), backend(), run() and the request-serving methods may be called concurrently.  run() may be called
 * only once at a time.
 */
class Control_server :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constants.

  /// Body of the page served at `/` when the status page is off.
  static const std::string S_ROOT_PAGE_HTML;

  /// `Content-Security-Policy` header value of the status page.
  static const std::string S_STATUS_PAGE_CSP;

  // Constructors/destructor.

  /**
   * Constructs a server with no backend bound, not running.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param config
   *        Configuration; copied.
   * @param api_handler_or_null
   *        Handler of `/localapi/` requests; if null those get 404.  Must outlive `*this`.
   * @param identity_resolver_or_null
   *        Identity strategy; if null, `make_identity_resolver(logger_ptr, config.m_platform)` is used.
   */
  explicit Control_server(flow::log::Logger* logger_ptr, const Server_config& config,
                          Api_handler* api_handler_or_null = 0,
                          std::unique_ptr<Identity_resolver>&& identity_resolver_or_null = {});

  /// Destroys the server; and the backend if bound.  run() must have returned.
  ~Control_server();

  // Methods.

  /**
   * Binds the backend; and starts it if run() has been called (and its prefs are valid).  Aborts the program if
   * `backend` is null or if a backend is already bound.
   *
   * @param backend
   *        The backend; `*this` takes ownership.
   */
  void bind_backend(std::unique_ptr<Backend>&& backend);

  /**
   * The bound backend; null if none yet.  Lock-free.
   * @return See above.
   */
  Backend* backend() const;

  /**
   * The bound backend, for code paths where it must be bound; aborts the program if not.
   * @return See above.
   */
  Backend& must_backend() const;

  /**
   * Serves connections from `*listener` until it fails.  `cancellation->cancel()` closes the listener and so
   * stops the serving; an accept failure due to that is not an error.  On the way out, whatever the reason, it
   * cancels reading on every open connection (Conn::cancel()), so idle keep-alive connections close at once; then
   * shuts down the bound backend (if any) without waiting for requests in flight; then waits for those to be
   * answered and their connections closed.
   *
   * @param listener
   *        Listener; not null.  It is closed upon return.
   * @param cancellation
   *        Cancellation signal; not null.  Must outlive this call.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error codes are the Listener's, from
   *        accept(), unless due to cancellation.
   */
  void run(Listener* listener, Cancellation* cancellation, Error_code* err_code = 0);

  /**
   * Serves one connection to completion: resolves its identity, then handles its requests until it is closed,
   * not kept alive, idle too long, canceled, or fails.  run() invokes it in a dedicated thread for each accepted
   * Conn; an embedding host with its own accept loop may invoke it directly.
   *
   * @param conn
   *        The connection; not null.
   */
  void serve_conn(Conn* conn);

  /**
   * Handles one request, filling out the response.  Routing, in order:
   *   - CONNECT: 405.
   *   - No backend bound: 503.
   *   - Identity resolution failed (`identity_err_code` truthy): 401 with the error's message.
   *   - Session_tracker::add_active_request() refused: 401 with the refusal's message.
   *   - Otherwise the request is active until this returns; and:
   *     - target `/localapi/...`: Api_handler, with permissions from local_api_permissions();
   *     - target other than `/`: 404;
   *     - `/` with Server_config::m_serve_status_page: serve_status_page();
   *     - `/`: #S_ROOT_PAGE_HTML.
   *
   * @param req
   *        Request.
   * @param identity
   *        Identity of the connection, as resolved; null if resolution failed.
   * @param identity_err_code
   *        Resolution error, if any.
   * @param rsp
   *        Response to fill out (but not prepare_payload()).
   */
  void handle_request(const Request& req, const Conn_identity::Ptr& identity, const Error_code& identity_err_code,
                      Response* rsp);

  /**
   * Permissions of the given identity's local API requests under Server_config::m_platform: compute_permissions()
   * with the single-active-user check outcome, the backend's operator, and the configured cert user.
   * The backend must be bound.
   *
   * @param identity
   *        Identity.
   * @return See above.
   */
  Permissions local_api_permissions(const Conn_identity& identity) const;

  /**
   * Serves the HTML status page: 403 unless the `Host` is `localhost:...` or has no letters (an IP address);
   * otherwise the backend's status with headers forbidding framing, scripting and sniffing.  The backend must be
   * bound.
   *
   * @param req
   *        Request.
   * @param rsp
   *        Response to fill out.
   */
  void serve_status_page(const Request& req, Response* rsp) const;

  /**
   * Configuration.
   * @return See above.
   */
  const Server_config& config() const;

  /**
   * The session tracker, for observation.
   * @return See above.
   */
  const Session_tracker& session_tracker() const;

private:
  // Methods.

  /// Starts the backend if and only if run() was called, it is bound, its prefs are valid, and it is not yet started.
  void start_backend_if_needed();

  // Data.

  /// See ctor.
  const Server_config m_config;

  /// See ctor.
  Api_handler* const m_api_handler;

  /// See ctor.
  const std::unique_ptr<Identity_resolver> m_identity_resolver;

  /// Active-request registry.
  Session_tracker m_session_tracker;

  /// The bound backend; null until bind_backend().  Set exactly once (compare-and-set).
  std::atomic<Backend*> m_backend;

  /// Owns `*m_backend`; written only by the bind_backend() call that wins the compare-and-set.
  std::unique_ptr<Backend> m_backend_owner;

  /// Whether run() has been called.
  std::atomic<bool> m_run_called;

  /// Guards the single Backend::start().
  std::once_flag m_backend_started;

  /// Whether Backend::shutdown() has been called.
  std::atomic<bool> m_backend_shut_down;
}; // class Control_server

} // namespace ctl::session
