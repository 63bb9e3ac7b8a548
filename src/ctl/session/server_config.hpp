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

#include "ctl/session/platform.hpp"

namespace ctl::session
{

// Types.

/**
 * Configuration of a Control_server.  This is a data store (and a simple one); a default-constructed object holds
 * the defaults for native_platform().  Set members directly; or apply the environment knobs with
 * load_server_config_from_env().
 *
 * If you change #m_platform after construction, you'll usually want to re-derive #m_reset_on_idle and
 * #m_serve_status_page with set_platform() rather than assigning #m_platform alone.
 */
struct Server_config
{
  // Constructors/destructor.

  /// Defaults for native_platform().
  Server_config();

  // Methods.

  /**
   * Sets #m_platform and the members whose defaults derive from it.
   *
   * @param platform
   *        Platform.
   */
  void set_platform(Platform platform);

  // Data.

  /// Platform whose identity and permission conventions apply.  Env: `CTL_PLATFORM`.
  Platform m_platform;

  /// User ID or user name allowed to fetch certificates; empty means nobody.  Env: `CTL_PERMIT_CERT_UID`.
  std::string m_permit_cert_uid;

  /// Whether to reset the backend each time the last active request completes.  Default: resets_on_idle().
  bool m_reset_on_idle;

  /// Whether `/` renders the backend's status page (as opposed to a fixed page).  Default: Windows only.
  bool m_serve_status_page;

  /// See Start_options::m_backend_log_id.
  std::string m_backend_log_id;

  /// Each connection is closed after this long without a complete request (or response write).
  util::Fine_duration m_conn_idle_timeout;
}; // struct Server_config

// Constants.

/// Name of the environment variable overriding Server_config::m_platform.
extern const std::string S_ENV_PLATFORM;

/// Name of the environment variable overriding Server_config::m_permit_cert_uid.
extern const std::string S_ENV_PERMIT_CERT_UID;

// Free functions.

/**
 * Applies the environment variables (S_ENV_PLATFORM, S_ENV_PERMIT_CERT_UID) that are set to `*config`.  A
 * platform value that does not parse is logged and ignored.
 *
 * @param logger_ptr
 *        Logger to use for logging.
 * @param config
 *        Config to modify.  Must not be null.
 */
void load_server_config_from_env(flow::log::Logger* logger_ptr, Server_config* config);

/**
 * Prints string representation of the given `Server_config` to the given `ostream`.
 *
 * @relatesalso Server_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Server_config& val);

} // namespace ctl::session
