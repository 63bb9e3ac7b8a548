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
#include "ctl/session/conn_identity.hpp"

namespace ctl::session
{

// Implementations.

std::string display_user(const Conn_identity& identity)
{
  using std::to_string;

  if (identity.m_username && (!identity.m_username->empty()))
  {
    return *identity.m_username;
  }
  // else
  if (!identity.m_user_id.empty())
  {
    return identity.m_user_id;
  }
  // else
  if (identity.m_peer_creds)
  {
    return to_string(identity.m_peer_creds->user_id());
  }
  // else
  return "<unknown user>";
}

std::ostream& operator<<(std::ostream& os, const Conn_identity& val)
{
  os << '[' << val.m_transport_kind << "] pid[";
  if (val.m_process_id)
  {
    os << *val.m_process_id;
  }
  os << "] user[" << val.m_user_id << '/';
  if (val.m_username)
  {
    os << *val.m_username;
  }
  os << "] creds[";
  if (val.m_peer_creds)
  {
    os << *val.m_peer_creds;
  }
  return os << ']';
}

std::ostream& operator<<(std::ostream& os, Transport_kind val)
{
  switch (val)
  {
  case Transport_kind::S_PIPE:
    return os << "pipe";
  case Transport_kind::S_DOMAIN_SOCKET:
    return os << "unix";
  case Transport_kind::S_OTHER:
    return os << "other";
  }
  assert(false);
  return os;
}

} // namespace ctl::session
