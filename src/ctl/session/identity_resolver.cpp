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
#include "ctl/session/identity_resolver.hpp"
#include "ctl/session/error.hpp"
#include <boost/make_shared.hpp>

namespace ctl::session
{

// Identity_resolver implementations.

Identity_resolver::Identity_resolver(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION)
{
  // Nothing else.
}

Identity_resolver::~Identity_resolver() = default;

// Pipe_identity_resolver implementations.

Pipe_identity_resolver::Pipe_identity_resolver(flow::log::Logger* logger_ptr,
                                               const Pipe_client_query& pipe_query,
                                               const User_directory& user_dir) :
  Identity_resolver(logger_ptr),
  m_pipe_query(pipe_query),
  m_user_dir(user_dir)
{
  // Nothing else.
}

Conn_identity::Ptr Pipe_identity_resolver::resolve(const Conn& conn, Error_code* err_code) const
{
  using boost::make_shared;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Conn_identity::Ptr, Pipe_identity_resolver::resolve, conn, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto handle = conn.native_pipe_handle();
  if (!handle)
  {
    FLOW_LOG_WARNING("Pipe identity resolver: Connection of kind [" << conn.transport_kind() << "] is not "
                     "backed by a named pipe; cannot learn its client process.");
    *err_code = error::Code::S_IDENTITY_NOT_PIPE_BACKED;
    return Conn_identity::Ptr();
  }
  // else

  // Fill out a local copy; only hand it out (frozen as const) once every step has succeeded.
  Conn_identity identity;
  identity.m_transport_kind = Transport_kind::S_PIPE;

  Error_code sys_err_code;
  const auto pid = m_pipe_query.client_process_id(*handle, &sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Pipe identity resolver: Could not obtain client PID of pipe: "
                     "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
    *err_code = error::Code::S_IDENTITY_CLIENT_PID_QUERY_FAILED;
    return Conn_identity::Ptr();
  }
  // else
  identity.m_process_id = pid;

  identity.m_user_id = m_pipe_query.process_owner_user_id(pid, &sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Pipe identity resolver: Client PID [" << pid << "] obtained, but its owner could not be "
                     "determined (a WSL process perhaps?): "
                     "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
    *err_code = error::Code::S_IDENTITY_PROCESS_OWNER_UNKNOWN;
    return Conn_identity::Ptr();
  }
  // else

  auto username = m_user_dir.username_of(identity.m_user_id, &sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Pipe identity resolver: Client PID [" << pid << "] is owned by user ID "
                     "[" << identity.m_user_id << "], but that user could not be looked up: "
                     "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
    *err_code = error::Code::S_IDENTITY_USER_LOOKUP_FAILED;
    return Conn_identity::Ptr();
  }
  // else
  identity.m_username = std::move(username);

  FLOW_LOG_TRACE("Pipe identity resolver: Resolved [" << identity << "].");
  err_code->clear();
  return make_shared<const Conn_identity>(std::move(identity));
} // Pipe_identity_resolver::resolve()

// Credential_identity_resolver implementations.

Credential_identity_resolver::Credential_identity_resolver(flow::log::Logger* logger_ptr,
                                                           const User_directory& user_dir) :
  Identity_resolver(logger_ptr),
  m_user_dir(user_dir)
{
  // Nothing else.
}

Conn_identity::Ptr Credential_identity_resolver::resolve(const Conn& conn, Error_code* err_code) const
{
  using boost::make_shared;
  using std::to_string;

  Conn_identity identity;
  identity.m_transport_kind = conn.transport_kind();
  identity.m_peer_creds = conn.peer_process_credentials();

  if (identity.m_peer_creds)
  {
    identity.m_process_id = identity.m_peer_creds->process_id();

    Error_code lookup_err_code;
    auto username = m_user_dir.username_of(to_string(identity.m_peer_creds->user_id()), &lookup_err_code);
    if (lookup_err_code)
    {
      FLOW_LOG_INFO("Credential identity resolver: Peer credentials [" << *identity.m_peer_creds << "] obtained; "
                    "but the UID is not known to the user database ([" << lookup_err_code << "] "
                    "[" << lookup_err_code.message() << "]); continuing without a user name.");
    }
    else
    {
      identity.m_username = std::move(username);
    }
  }
  else
  {
    FLOW_LOG_TRACE("Credential identity resolver: Connection of kind [" << identity.m_transport_kind << "] "
                   "carries no peer credentials.");
  }

  if (err_code)
  {
    err_code->clear();
  }
  return make_shared<const Conn_identity>(std::move(identity));
} // Credential_identity_resolver::resolve()

// Free function implementations.

std::unique_ptr<Identity_resolver> make_identity_resolver(flow::log::Logger* logger_ptr, Platform platform)
{
  if (uses_pipe_identity(platform))
  {
    return std::make_unique<Pipe_identity_resolver>(logger_ptr);
  }
  // else
  return std::make_unique<Credential_identity_resolver>(logger_ptr);
}

} // namespace ctl::session
