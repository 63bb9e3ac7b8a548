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
#include "ctl/session/server_config.hpp"
#include <boost/chrono/chrono_io.hpp>
#include <boost/chrono/round.hpp>
#include <cstdlib>
#include <sstream>

namespace ctl::session
{

// Static initializers.

const std::string S_ENV_PLATFORM = "CTL_PLATFORM";
const std::string S_ENV_PERMIT_CERT_UID = "CTL_PERMIT_CERT_UID";

// Implementations.

Server_config::Server_config() :
  m_conn_idle_timeout(boost::chrono::seconds(5))
{
  set_platform(native_platform());
}

void Server_config::set_platform(Platform platform)
{
  m_platform = platform;
  m_reset_on_idle = resets_on_idle(platform);
  m_serve_status_page = platform == Platform::S_WINDOWS;
}

void load_server_config_from_env(flow::log::Logger* logger_ptr, Server_config* config)
{
  using std::getenv;
  using std::istringstream;

  assert(config);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_SESSION);

  if (const auto val = getenv(S_ENV_PLATFORM.c_str()))
  {
    istringstream is(val);
    auto platform = Platform::S_END_SENTINEL;
    is >> platform;
    if (platform == Platform::S_END_SENTINEL)
    {
      FLOW_LOG_WARNING("Env [" << S_ENV_PLATFORM << "] = [" << val << "] is not a known platform; ignoring it and "
                       "keeping [" << config->m_platform << "].");
    }
    else
    {
      FLOW_LOG_INFO("Env [" << S_ENV_PLATFORM << "] selects platform [" << platform << "].");
      config->set_platform(platform);
    }
  }

  if (const auto val = getenv(S_ENV_PERMIT_CERT_UID.c_str()))
  {
    FLOW_LOG_INFO("Env [" << S_ENV_PERMIT_CERT_UID << "] permits cert fetch by [" << val << "].");
    config->m_permit_cert_uid = val;
  }
} // load_server_config_from_env()

std::ostream& operator<<(std::ostream& os, const Server_config& val)
{
  return os << "platform[" << val.m_platform << "] permit_cert_uid[" << val.m_permit_cert_uid << "] "
               "reset_on_idle[" << val.m_reset_on_idle << "] serve_status_page[" << val.m_serve_status_page << "] "
               "backend_log_id[" << val.m_backend_log_id << "] "
               "conn_idle_timeout[" << boost::chrono::round<boost::chrono::milliseconds>(val.m_conn_idle_timeout)
            << ']';
}

} // namespace ctl::session
