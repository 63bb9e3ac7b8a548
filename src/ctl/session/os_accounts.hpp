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

namespace ctl::session
{

// Types.

/**
 * Lookups in the OS user database, in the string form used throughout ctl::session for user IDs: the decimal
 * UID on Unix-likes, the SID string (`S-1-5-21-...`) on Windows.
 *
 * All OS account calls made by ctl::session go through this interface and Pipe_client_query, so that no other
 * code branches on the OS; and so that tests can supply a fake directory.  The native implementation is
 * native_user_directory().
 *
 * Implementations must be safe to use concurrently from multiple threads.
 */
class User_directory
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~User_directory();

  // Methods.

  /**
   * Maps a user ID to the user's name.
   *
   * @param user_id
   *        User ID, string form.
   * @param err_code
   *        Must not be null.  Set to success or to a system error (or `S_IDENTITY_USER_LOOKUP_FAILED` if the
   *        OS reported no error but also no such user).
   * @return The name; empty on error.
   */
  virtual std::string username_of(const std::string& user_id, Error_code* err_code) const = 0;

  /**
   * Maps a user name to the user's ID.
   *
   * @param username
   *        Name.
   * @param err_code
   *        Must not be null.  Set as in username_of().
   * @return The user ID, string form; empty on error.
   */
  virtual std::string user_id_of(const std::string& username, Error_code* err_code) const = 0;
}; // class User_directory

/**
 * Queries about the process at the client end of a named pipe.  Meaningful on Windows only; the native
 * implementation elsewhere (native_pipe_client_query()) reports `operation_not_supported` for
 * client_process_id().  Same threading and rationale notes as User_directory.
 */
class Pipe_client_query
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Pipe_client_query();

  // Methods.

  /**
   * The PID of the client process bound to the given named pipe.
   *
   * @param handle
   *        Native pipe handle from Conn::native_pipe_handle().
   * @param err_code
   *        Must not be null.  Set to success or to a system error.
   * @return The PID; 0 on error.
   */
  virtual util::process_id_t client_process_id(util::pipe_handle_t handle, Error_code* err_code) const = 0;

  /**
   * The user ID (string form) of the owner of the given process.
   *
   * @param process_id
   *        PID.
   * @param err_code
   *        Must not be null.  Set to success or to a system error.
   * @return The user ID; empty on error.
   */
  virtual std::string process_owner_user_id(util::process_id_t process_id, Error_code* err_code) const = 0;
}; // class Pipe_client_query

// Free functions.

/**
 * The process-wide User_directory backed by the OS (`getpwuid_r()`/`getpwnam_r()`, or `LookupAccountSid()`/
 * `LookupAccountName()` on Windows).
 *
 * @return See above.  The reference is valid for the life of the process.
 */
const User_directory& native_user_directory();

/**
 * The process-wide Pipe_client_query backed by the OS (`GetNamedPipeClientProcessId()` and the process token on
 * Windows; elsewhere no pipes, but process ownership is still answered from `/proc`).
 *
 * @return See above.  The reference is valid for the life of the process.
 */
const Pipe_client_query& native_pipe_client_query();

} // namespace ctl::session
