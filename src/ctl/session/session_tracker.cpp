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
#include "ctl/session/session_tracker.hpp"
#include "ctl/session/error.hpp"
#include <sstream>

namespace ctl::session
{

// Session_tracker implementations.

Session_tracker::Session_tracker(flow::log::Logger* logger_ptr, bool reset_on_idle) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_reset_on_idle(reset_on_idle),
  m_last_request_id(0)
{
  FLOW_LOG_TRACE("Session tracker [" << this << "]: Created; reset-on-idle [" << m_reset_on_idle << "].");
}

Session_tracker::request_id_t Session_tracker::add_active_request(const Conn_identity::Ptr& identity,
                                                                  Backend* backend,
                                                                  std::string* denial_msg_or_null,
                                                                  Error_code* err_code)
{
  using flow::error::Runtime_error;

  if (!err_code)
  {
    Error_code our_err_code;
    std::string denial_msg;
    const auto id = add_active_request(identity, backend, &denial_msg, &our_err_code);
    if (our_err_code)
    {
      if (denial_msg_or_null)
      {
        *denial_msg_or_null = denial_msg;
      }
      throw Runtime_error(our_err_code, denial_msg);
    }
    return id;
  }
  // else

  assert(identity && backend);

  Add_decision decision;
  {
    Lock_guard lock(m_mutex);
    decision = add_active_request_locked(identity, backend, denial_msg_or_null, err_code);
  } // Lock released: reset (which can take a while and takes backend locks) must not run under it.

  if (*err_code)
  {
    return 0;
  }
  // else

  if (decision.m_reset)
  {
    FLOW_LOG_INFO("Session tracker [" << this << "]: Identity changed from user ID [" << decision.m_prev_user_id << "] "
                  "to [" << *identity << "]; resetting backend state of the previous session.");
    backend->reset_for_client_disconnect();
  }
  return decision.m_id;
} // Session_tracker::add_active_request()

Session_tracker::Add_decision Session_tracker::add_active_request_locked(const Conn_identity::Ptr& identity,
                                                                         Backend* backend,
                                                                         std::string* denial_msg_or_null,
                                                                         Error_code* err_code)
{
  Add_decision decision;

  if (!check_conn_identity_locked(*identity, denial_msg_or_null))
  {
    FLOW_LOG_WARNING("Session tracker [" << this << "]: Refusing request from [" << *identity << "]: a different "
                     "user has [" << m_active_requests.size() << "] request(s) active.");
    *err_code = error::Code::S_ACCESS_DENIED_OTHER_USER_ACTIVE;
    return decision;
  }
  // else

  const auto policy_err_code = backend->check_connection_allowed(*identity);
  if (policy_err_code)
  {
    FLOW_LOG_WARNING("Session tracker [" << this << "]: Refusing request from [" << *identity << "]: backend "
                     "policy says [" << policy_err_code << "] [" << policy_err_code.message() << "].");
    if (denial_msg_or_null)
    {
      *denial_msg_or_null = policy_err_code.message();
    }
    *err_code = error::Code::S_ACCESS_DENIED_BY_POLICY;
    return decision;
  }
  // else

  decision.m_id = ++m_last_request_id;
  m_active_requests.emplace(decision.m_id, identity);

  const auto& user_id = identity->m_user_id;
  if ((!user_id.empty()) && (m_active_requests.size() == 1))
  {
    backend->set_current_user_id(user_id);
    if (user_id != m_last_user_id)
    {
      if (!m_last_user_id.empty())
      {
        decision.m_reset = true;
        decision.m_prev_user_id = m_last_user_id;
      }
      m_last_user_id = user_id;
    }
  }

  FLOW_LOG_TRACE("Session tracker [" << this << "]: Registered request [" << decision.m_id << "] from "
                 "[" << *identity << "]; [" << m_active_requests.size() << "] now active.");
  err_code->clear();
  return decision;
} // Session_tracker::add_active_request_locked()

void Session_tracker::remove_active_request(request_id_t id, Backend* backend)
{
  assert(backend);

  size_t n_remaining;
  {
    Lock_guard lock(m_mutex);
    m_active_requests.erase(id);
    n_remaining = m_active_requests.size();
  }

  FLOW_LOG_TRACE("Session tracker [" << this << "]: Deregistered request [" << id << "]; "
                 "[" << n_remaining << "] remain active.");

  if ((n_remaining != 0) || (!m_reset_on_idle))
  {
    return;
  }
  // else

  if (backend->in_server_mode())
  {
    FLOW_LOG_INFO("Session tracker [" << this << "]: Last client disconnected; staying alive in server mode.");
  }
  else
  {
    FLOW_LOG_INFO("Session tracker [" << this << "]: Last client disconnected; resetting backend state.");
    backend->reset_for_client_disconnect();
  }
} // Session_tracker::remove_active_request()

bool Session_tracker::check_conn_identity(const Conn_identity& identity, std::string* conflict_msg_or_null) const
{
  Lock_guard lock(m_mutex);
  return check_conn_identity_locked(identity, conflict_msg_or_null);
}

bool Session_tracker::check_conn_identity_locked(const Conn_identity& identity,
                                                 std::string* conflict_msg_or_null) const
{
  for (const auto& id_and_identity : m_active_requests)
  {
    const auto& active = *id_and_identity.second;
    if (active.m_user_id != identity.m_user_id)
    {
      if (conflict_msg_or_null)
      {
        std::ostringstream os;
        os << "Server already in use by " << display_user(active) << ", pid ";
        if (active.m_process_id)
        {
          os << *active.m_process_id;
        }
        else
        {
          os << '?';
        }
        *conflict_msg_or_null = os.str();
      }
      return false;
    }
  }
  return true;
} // Session_tracker::check_conn_identity_locked()

size_t Session_tracker::n_active_requests() const
{
  Lock_guard lock(m_mutex);
  return m_active_requests.size();
}

std::string Session_tracker::last_user_id() const
{
  Lock_guard lock(m_mutex);
  return m_last_user_id;
}

// Session_tracker::Active_request implementations.

Session_tracker::Active_request::Active_request(Session_tracker* tracker, request_id_t id, Backend* backend) :
  m_tracker(tracker),
  m_id(id),
  m_backend(backend)
{
  assert(m_tracker && m_backend && (m_id != 0));
}

Session_tracker::Active_request::~Active_request()
{
  m_tracker->remove_active_request(m_id, m_backend);
}

Session_tracker::request_id_t Session_tracker::Active_request::id() const
{
  return m_id;
}

} // namespace ctl::session
