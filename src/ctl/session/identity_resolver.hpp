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

#include "ctl/session/conn.hpp"
#include "ctl/session/os_accounts.hpp"
#include "ctl/session/platform.hpp"
#include <boost/noncopyable.hpp>

namespace ctl::session
{

// Types.

/**
 * Strategy that maps one accepted Conn to the Conn_identity of the process at its other end.
 *
 * Control_server holds exactly one of these, chosen once at startup by make_identity_resolver() according to the
 * configured Platform; so nothing downstream (Session_tracker, compute_permissions()) ever branches on the OS.
 * resolve() is invoked exactly once per connection, synchronously, in the thread serving that connection, before
 * its first request is dispatched.  It may block on OS calls; it blocks only that connection.
 *
 * ### Thread safety ###
 * resolve() may be invoked concurrently from multiple threads.
 */
class Identity_resolver :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Identity_resolver();

  // Methods.

  /**
   * Resolves the identity of the connecting process.
   *
   * @param conn
   *        The connection, freshly accepted.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Codes are strategy-specific; see the
   *        subclasses.  All emitted codes satisfy error::is_identity_resolution_error().
   * @return The identity; null if and only if an error is emitted.
   */
  virtual Conn_identity::Ptr resolve(const Conn& conn, Error_code* err_code = 0) const = 0;

protected:
  // Constructors.

  /**
   * Constructor.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Identity_resolver(flow::log::Logger* logger_ptr);
}; // class Identity_resolver

/**
 * Identity_resolver for named-pipe platforms: the client process is learned from the OS-level pipe, its owner
 * from the process, and a display name from the owner.  All three steps must succeed, else resolution fails
 * with a code naming the failed step:
 *   - the Conn exposes no pipe handle: error::Code::S_IDENTITY_NOT_PIPE_BACKED;
 *   - the pipe's client PID is not available: error::Code::S_IDENTITY_CLIENT_PID_QUERY_FAILED;
 *   - the PID's owner is not available (typical of a WSL process): error::Code::S_IDENTITY_PROCESS_OWNER_UNKNOWN;
 *   - the owner is not in the user database: error::Code::S_IDENTITY_USER_LOOKUP_FAILED.
 *
 * On success Conn_identity::m_user_id, `m_process_id` and `m_username` are all filled.
 */
class Pipe_identity_resolver : public Identity_resolver
{
public:
  // Constructors/destructor.

  /**
   * Constructor.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param pipe_query
   *        OS pipe/process queries.  Must outlive `*this`.
   * @param user_dir
   *        OS user database.  Must outlive `*this`.
   */
  explicit Pipe_identity_resolver(flow::log::Logger* logger_ptr,
                                  const Pipe_client_query& pipe_query = native_pipe_client_query(),
                                  const User_directory& user_dir = native_user_directory());

  // Methods.

  /**
   * Implements Identity_resolver API.  See class doc header for error codes.
   *
   * @param conn
   *        See Identity_resolver.
   * @param err_code
   *        See Identity_resolver.
   * @return See Identity_resolver.
   */
  Conn_identity::Ptr resolve(const Conn& conn, Error_code* err_code = 0) const override;

private:
  // Data.

  /// See ctor.
  const Pipe_client_query& m_pipe_query;

  /// See ctor.
  const User_directory& m_user_dir;
}; // class Pipe_identity_resolver

/**
 * Identity_resolver for Unix-domain-socket platforms: the identity is whatever peer credentials the transport
 * reports.  It never fails: a Conn without credentials yields an identity without them (and hence, downstream,
 * without write and cert permissions).  When credentials are present, the UID's user name is recorded for display
 * if the user database knows it; lookup trouble is only logged.
 *
 * Conn_identity::m_user_id is always left empty.
 */
class Credential_identity_resolver : public Identity_resolver
{
public:
  // Constructors/destructor.

  /**
   * Constructor.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param user_dir
   *        OS user database.  Must outlive `*this`.
   */
  explicit Credential_identity_resolver(flow::log::Logger* logger_ptr,
                                        const User_directory& user_dir = native_user_directory());

  // Methods.

  /**
   * Implements Identity_resolver API.  Never emits an error.
   *
   * @param conn
   *        See Identity_resolver.
   * @param err_code
   *        See Identity_resolver.  Always set to success if not null.
   * @return See Identity_resolver.  Never null.
   */
  Conn_identity::Ptr resolve(const Conn& conn, Error_code* err_code = 0) const override;

private:
  // Data.

  /// See ctor.
  const User_directory& m_user_dir;
}; // class Credential_identity_resolver

// Free functions.

/**
 * Creates the Identity_resolver appropriate to the given platform, backed by the native OS seams:
 * Pipe_identity_resolver if uses_pipe_identity(), else Credential_identity_resolver.
 *
 * @param logger_ptr
 *        Logger to pass to the resolver.
 * @param platform
 *        Platform.
 * @return See above.  Never null.
 */
std::unique_ptr<Identity_resolver> make_identity_resolver(flow::log::Logger* logger_ptr, Platform platform);

} // namespace ctl::session
