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

/**
 * Namespace containing the ctl::session module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.
 *
 * The codes fall into two families that callers usually care about more than the individual codes:
 *   - identity-resolution errors (see is_identity_resolution_error()): the connection could not be mapped to a
 *     process/user identity; connection-scoped, not retriable;
 *   - access-denied errors (see is_access_denied()): the identity is known, but it may not use the server right
 *     now -- either another local user is active, or the backend's policy rejects the identity.
 */
namespace ctl::session::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by ctl::session functions/methods *outside of*
 * system-triggered errors (such as those from the OS user database or socket layer).
 */
enum class Code
{
  /// User called an API with 1 or more arguments against the API spec.
  S_INVALID_ARGUMENT = S_CODE_LOWEST_INT_VALUE,

  /// Identity resolution: the connection is not backed by a named pipe, so its client process cannot be queried.
  S_IDENTITY_NOT_PIPE_BACKED,

  /// Identity resolution: the OS could not report the client process ID bound to the connection's named pipe.
  S_IDENTITY_CLIENT_PID_QUERY_FAILED,

  /**
   * Identity resolution: the client process ID could not be mapped to its owning user; this is typical of
   * a process living in another namespace or subsystem (such as WSL).
   */
  S_IDENTITY_PROCESS_OWNER_UNKNOWN,

  /// Identity resolution: the owning user ID of the client process could not be looked up in the user database.
  S_IDENTITY_USER_LOOKUP_FAILED,

  /// Access denied: requests from a different local user are currently active; wait for that session to end.
  S_ACCESS_DENIED_OTHER_USER_ACTIVE,

  /// Access denied: the backend's connection policy rejected the identity of the connecting process.
  S_ACCESS_DENIED_BY_POLICY,

  /// A request arrived before a backend was bound to the server.
  S_NO_BACKEND,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight `Error_code` (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `Error_code(Code)` constructor work (and thus implicit
 * conversion from `Code` to `Error_code`).
 *
 * @param err_code
 *        See above.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Returns `true` if and only if `err_code` is one of the identity-resolution codes
 * (`S_IDENTITY_*`).
 *
 * @param err_code
 *        Any code, including system ones.
 * @return See above.
 */
bool is_identity_resolution_error(const Error_code& err_code);

/**
 * Returns `true` if and only if `err_code` is one of the access-denied codes (`S_ACCESS_DENIED_*`).
 *
 * @param err_code
 *        Any code, including system ones.
 * @return See above.
 */
bool is_access_denied(const Error_code& err_code);

/**
 * Deserializes a Code from a standard input stream: a symbol as printed by `operator<<(Code)` (case-insensitive)
 * or the numeric value.  Anything else yields `Code::S_END_SENTINEL`.
 *
 * @param is
 *        Stream from which to read.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);
// @todo - `@relatesalso Code` makes Doxygen complain; maybe it doesn't work with `enum class`es like Code.

/**
 * Serializes a Code to a standard output stream, as its symbol, such as `ACCESS_DENIED_BY_POLICY`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);
// @todo - `@relatesalso Code` makes Doxygen complain; maybe it doesn't work with `enum class`es like Code.

} // namespace ctl::session::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::ctl::session::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
