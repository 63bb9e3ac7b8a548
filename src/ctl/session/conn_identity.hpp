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

#include "ctl/common.hpp"
#include <boost/shared_ptr.hpp>
#include <optional>

namespace ctl::session
{

// Types.

/// The kind of local channel over which a Conn arrived.
enum class Transport_kind
{
  /// Named pipe (Windows).
  S_PIPE,
  /// Unix domain socket.
  S_DOMAIN_SOCKET,
  /// Anything else (such as an in-process or loopback channel used by an embedded host).
  S_OTHER
};

/**
 * The resolved identity of the process at the other end of one local connection.
 *
 * This is a data store (and a simple one).  An Identity_resolver creates one for each accepted Conn, once, before
 * that connection's first request is dispatched; from then on it is immutable and is passed around via #Ptr,
 * which is a ref-counted pointer to `const`.  The connection's serving context owns it; Session_tracker holds
 * an extra ref for each active request arriving on the connection; it disappears once the connection closes and
 * its last request has completed.
 *
 * ### Which members are filled ###
 * It depends on the strategy (and hence on the platform; see Platform):
 *   - Pipe_identity_resolver: #m_transport_kind is Transport_kind::S_PIPE; #m_process_id, #m_user_id and
 *     #m_username are always filled (resolution fails otherwise); #m_peer_creds is empty.
 *   - Credential_identity_resolver: #m_peer_creds is filled if the transport could report OS peer credentials;
 *     then #m_process_id is filled too, and #m_username if the UID was found in the user database.
 *     #m_user_id is always empty.
 *
 * ### Convention: #m_user_id as the session key ###
 * #m_user_id is what the single-active-user invariant compares (see Session_tracker).  It is filled only by the
 * strategy whose platform has a meaningful per-session user identity; elsewhere it is empty, and two empty
 * values compare equal -- so on those platforms the invariant trivially holds and never rejects anybody.
 * Code outside Identity_resolver therefore never needs to branch on platform.
 */
struct Conn_identity
{
  // Types.

  /// Ref-counted handle to an immutable identity.  Suitable for capturing and sharing across threads.
  using Ptr = boost::shared_ptr<const Conn_identity>;

  // Data.

  /// Kind of channel the connection arrived on.
  Transport_kind m_transport_kind = Transport_kind::S_OTHER;

  /// PID of the connecting process, if known.
  std::optional<util::process_id_t> m_process_id;

  /**
   * Resolved user ID in string form (on Windows, the SID string), compared to enforce the single-active-user
   * invariant; empty if the platform does not resolve one (see "Convention" above).
   */
  std::string m_user_id;

  /// Human-readable name of the connecting user, if known; for diagnostics only.
  std::optional<std::string> m_username;

  /// OS-reported credentials (PID, UID, GID) of the socket peer, if the transport exposes them.
  std::optional<util::Process_credentials> m_peer_creds;
}; // struct Conn_identity

// Free functions.

/**
 * The best available human-readable designation of the user behind `identity`: the username, else the
 * user ID, else the UID from peer credentials, else a placeholder.
 *
 * @param identity
 *        Identity.
 * @return See above.
 */
std::string display_user(const Conn_identity& identity);

/**
 * Prints string representation of the given `Conn_identity` to the given `ostream`.
 *
 * @relatesalso Conn_identity
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Conn_identity& val);

/**
 * Prints the symbolic name of the given `Transport_kind` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Transport_kind val);

} // namespace ctl::session
