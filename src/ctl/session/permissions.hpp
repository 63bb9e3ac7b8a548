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
#include "ctl/session/os_accounts.hpp"
#include "ctl/session/platform.hpp"

namespace ctl::session
{

// Types.

/// What a given connection may do through the local API.
struct Permissions
{
  // Data.

  /// May read state.
  bool m_read = false;

  /// May mutate state.
  bool m_write = false;

  /// May fetch TLS certificates and keys.
  bool m_cert = false;
}; // struct Permissions

/**
 * Everything compute_permissions() looks at.  Which members matter depends on #m_platform; see
 * compute_permissions().
 */
struct Permission_inputs
{
  // Data.

  /// Platform conventions to apply.
  Platform m_platform = native_platform();

  /// Kind of channel the connection arrived on.
  Transport_kind m_transport_kind = Transport_kind::S_OTHER;

  /// OS peer credentials of the connection, if any.
  std::optional<util::Process_credentials> m_peer_creds;

  /**
   * User ID (decimal UID string) of the daemon's operator, as reported by the backend.  Empty if none; an
   * empty value matches no peer.
   */
  std::string m_operator_user_id;

  /**
   * The configured user allowed to fetch certificates: a decimal UID, a user name, or empty (nobody).
   * See user_id_from_string().
   */
  std::string m_permit_cert_uid;

  /// Whether the single-active-user check passed for this connection.  Consulted on Platform::S_WINDOWS only.
  bool m_authorized = false;
}; // struct Permission_inputs

// Free functions.

/**
 * Computes the permissions of a connection.  The function is pure: same inputs (and same user database), same
 * result.
 *
 *   - Platform::S_WINDOWS: read and write both equal `m_authorized`; no cert.
 *   - Platform::S_JS: read and write; no cert.
 *   - any other platform:
 *     - read if and only if the connection is a Unix domain socket;
 *     - write if read, and peer credentials are known, and the peer's UID is not the operator's;
 *     - cert if the connection is a Unix domain socket, and peer credentials are known, and the peer's UID equals
 *       `user_id_from_string(m_permit_cert_uid)`.
 *
 * @param inputs
 *        See Permission_inputs.
 * @param user_dir
 *        Used to resolve a user name in `inputs.m_permit_cert_uid`.
 * @return See above.
 */
Permissions compute_permissions(const Permission_inputs& inputs,
                                const User_directory& user_dir = native_user_directory());

/**
 * Normalizes a configured user designation to a user ID string: empty or all-decimal-digit values are returned as-is;
 * anything else is taken as a user name and looked up; if that fails the result is empty (which matches no actual
 * user).
 *
 * @param val
 *        User ID or name.
 * @param user_dir
 *        User database.
 * @return See above.
 */
std::string user_id_from_string(const std::string& val, const User_directory& user_dir = native_user_directory());

/**
 * Returns `true` if and only if every character of `val` is an ASCII decimal digit.  So `true` for empty `val`.
 *
 * @param val
 *        String.
 * @return See above.
 */
bool is_all_digits(util::String_view val);

/**
 * Prints string representation of the given `Permissions` to the given `ostream`.
 *
 * @relatesalso Permissions
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Permissions& val);

/**
 * Returns `true` if and only if the two objects are equal member-wise.
 *
 * @relatesalso Permissions
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(const Permissions& val1, const Permissions& val2);

} // namespace ctl::session
