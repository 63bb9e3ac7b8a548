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
#include "ctl/session/permissions.hpp"
#include <algorithm>

namespace ctl::session
{

// Implementations.

Permissions compute_permissions(const Permission_inputs& inputs, const User_directory& user_dir)
{
  using std::to_string;

  Permissions perms;
  switch (inputs.m_platform)
  {
  case Platform::S_WINDOWS:
    perms.m_read = perms.m_write = inputs.m_authorized;
    return perms;
  case Platform::S_JS:
    perms.m_read = perms.m_write = true;
    return perms;
  default:
    break;
  }

  const bool is_domain_socket = inputs.m_transport_kind == Transport_kind::S_DOMAIN_SOCKET;
  const auto peer_uid = inputs.m_peer_creds ? to_string(inputs.m_peer_creds->user_id()) : std::string();

  perms.m_read = is_domain_socket;
  /* The operator may not write through here.  (An empty operator ID is not equal to any UID string, since the
   * latter is never empty.) */
  perms.m_write = perms.m_read && inputs.m_peer_creds && (peer_uid != inputs.m_operator_user_id);
  perms.m_cert = is_domain_socket && inputs.m_peer_creds
                   && (peer_uid == user_id_from_string(inputs.m_permit_cert_uid, user_dir));
  return perms;
} // compute_permissions()

std::string user_id_from_string(const std::string& val, const User_directory& user_dir)
{
  if (is_all_digits(val))
  {
    return val;
  }
  // else

  Error_code err_code;
  auto user_id = user_dir.user_id_of(val, &err_code);
  return err_code ? std::string() : user_id;
}

bool is_all_digits(util::String_view val)
{
  return std::all_of(val.begin(), val.end(), [](char ch) { return (ch >= '0') && (ch <= '9'); });
}

std::ostream& operator<<(std::ostream& os, const Permissions& val)
{
  return os << "read[" << val.m_read << "] write[" << val.m_write << "] cert[" << val.m_cert << ']';
}

bool operator==(const Permissions& val1, const Permissions& val2)
{
  return (val1.m_read == val2.m_read) && (val1.m_write == val2.m_write) && (val1.m_cert == val2.m_cert);
}

} // namespace ctl::session
