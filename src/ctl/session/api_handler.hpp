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

#include "ctl/session/backend.hpp"
#include "ctl/session/conn.hpp"
#include "ctl/session/permissions.hpp"

namespace ctl::session
{

// Types.

/// Everything the local API needs to know about the request being handled beyond the request itself.
struct Api_context
{
  // Data.

  /// The bound backend.  Not null.
  Backend* m_backend = nullptr;

  /// See Server_config::m_backend_log_id.
  std::string m_backend_log_id;

  /// Identity of the requester.  Not null.
  Conn_identity::Ptr m_identity;

  /// What the requester may do.
  Permissions m_permissions;
}; // struct Api_context

/**
 * The local API: Control_server routes each request whose target starts with `/localapi/` here, after the
 * request's identity has been registered as active; so when handle() runs the single-active-user invariant holds
 * and any identity-change reset has completed.  Dispatch among API routes is entirely the handler's business.
 *
 * ### Thread safety ###
 * handle() may be invoked concurrently from multiple threads.
 */
class Api_handler
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Api_handler();

  // Methods.

  /**
   * Handles one request.
   *
   * @param ctx
   *        See Api_context.
   * @param req
   *        The request.
   * @param rsp
   *        Response to fill out.  It arrives with version and keep-alive matching `req`; status 200; no body.
   */
  virtual void handle(const Api_context& ctx, const Request& req, Response* rsp) = 0;
}; // class Api_handler

} // namespace ctl::session
