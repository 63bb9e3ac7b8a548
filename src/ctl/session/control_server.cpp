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
#include "ctl/session/control_server.hpp"
#include "ctl/session/detail/conn_thread_set.hpp"
#include "ctl/session/error.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/scope_exit.hpp>
#include <algorithm>
#include <cstdlib>

namespace ctl::session
{

namespace
{

// Free functions.

/**
 * Fills out `*rsp` as a plain-text error response: the message plus newline as the body.
 *
 * @param rsp
 *        Response.
 * @param status
 *        Status.
 * @param msg
 *        Message.
 */
void respond_error(Response* rsp, boost::beast::http::status status, util::String_view msg)
{
  using boost::beast::http::field;

  rsp->result(status);
  rsp->set(field::content_type, "text/plain; charset=utf-8");
  rsp->set("X-Content-Type-Options", "nosniff");
  rsp->body().assign(msg.data(), msg.size());
  rsp->body() += '\n';
}

/**
 * Whether the `Host` value names the local machine by something other than a DNS name: `localhost:<port>`, or
 * anything without letters (an IP address).  Any non-ASCII byte counts as (part of) a letter.
 *
 * @param host
 *        Host header value.
 * @return See above.
 */
bool is_local_host(util::String_view host)
{
  using boost::algorithm::starts_with;

  const auto is_letter = [](char ch) -> bool
  {
    const auto byte = static_cast<unsigned char>(ch);
    return (byte >= 0x80) || ((byte >= 'a') && (byte <= 'z')) || ((byte >= 'A') && (byte <= 'Z'));
  };
  return starts_with(host, "localhost:") || std::none_of(host.begin(), host.end(), is_letter);
}

} // namespace (anon)

// Static initializers.

const std::string Control_server::S_ROOT_PAGE_HTML
  = "<html><title>Flow-Ctl</title><body><h1>Flow-Ctl</h1>This is the local control server of the daemon.\n";

const std::string Control_server::S_STATUS_PAGE_CSP
  = "default-src 'none'; frame-ancestors 'none'; script-src 'none'; script-src-elem 'none'; script-src-attr 'none'";

// Implementations.

Control_server::Control_server(flow::log::Logger* logger_ptr, const Server_config& config,
                               Api_handler* api_handler_or_null,
                               std::unique_ptr<Identity_resolver>&& identity_resolver_or_null) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_config(config),
  m_api_handler(api_handler_or_null),
  m_identity_resolver(identity_resolver_or_null
                        ? std::move(identity_resolver_or_null)
                        : make_identity_resolver(logger_ptr, m_config.m_platform)),
  m_session_tracker(logger_ptr, m_config.m_reset_on_idle),
  m_backend(nullptr),
  m_run_called(false),
  m_backend_shut_down(false)
{
  FLOW_LOG_INFO("Control server [" << this << "]: Created with config [" << m_config << "].");
}

Control_server::~Control_server()
{
  FLOW_LOG_INFO("Control server [" << this << "]: Shutting down.");
}

void Control_server::bind_backend(std::unique_ptr<Backend>&& backend)
{
  if (!backend)
  {
    FLOW_LOG_FATAL("Control server [" << this << "]: Asked to bind a null backend.  Aborting.");
    std::abort();
  }
  // else

  Backend* expected = nullptr;
  if (!m_backend.compare_exchange_strong(expected, backend.get()))
  {
    FLOW_LOG_FATAL("Control server [" << this << "]: Asked to bind backend [" << backend.get() << "], but "
                   "backend [" << expected << "] is already bound; it may be bound only once.  Aborting.");
    std::abort();
  }
  // else
  m_backend_owner = std::move(backend);

  FLOW_LOG_INFO("Control server [" << this << "]: Backend [" << m_backend.load() << "] bound.");
  start_backend_if_needed();
}

Backend* Control_server::backend() const
{
  return m_backend.load();
}

Backend& Control_server::must_backend() const
{
  const auto backend_ptr = m_backend.load();
  if (!backend_ptr)
  {
    FLOW_LOG_FATAL("Control server [" << this << "]: Backend required on a path where it must already have been "
                   "bound; but it has not been.  Aborting.");
    std::abort();
  }
  // else
  return *backend_ptr;
}

void Control_server::start_backend_if_needed()
{
  if (!m_run_called)
  {
    return;
  }
  // else
  const auto backend_ptr = m_backend.load();
  if ((!backend_ptr) || (!backend_ptr->prefs_valid()))
  {
    return;
  }
  // else

  std::call_once(m_backend_started, [&]()
  {
    FLOW_LOG_INFO("Control server [" << this << "]: Running with backend bound and prefs valid: starting backend.");
    Start_options opts;
    opts.m_backend_log_id = m_config.m_backend_log_id;
    backend_ptr->start(opts);
  });
}

void Control_server::run(Listener* listener, Cancellation* cancellation, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { run(listener, cancellation, actual_err_code); },
         err_code, "Control_server::run()"))
  {
    return;
  }
  // else

  assert(listener && cancellation);

  m_run_called = true;
  FLOW_LOG_INFO("Control server [" << this << "]: Run: Accepting connections.");

  Conn_thread_set conns(get_logger(), [this](Conn* conn) { serve_conn(conn); });

  const auto hook_id = cancellation->on_cancel([this, listener]()
  {
    FLOW_LOG_INFO("Control server [" << this << "]: Run: Canceled; closing listener.");
    listener->close();
  });

  /* On every way out (including an exception): stop accepting; stop reading on open connections; shut the backend
   * down, not waiting for requests in flight; then wait for those. */
  BOOST_SCOPE_EXIT_ALL(this, listener, cancellation, hook_id, &conns)
  {
    cancellation->remove_hook(hook_id);
    listener->close();
    conns.cancel_all();
    const auto backend_ptr = m_backend.load();
    if (backend_ptr && (!m_backend_shut_down.exchange(true)))
    {
      FLOW_LOG_INFO("Control server [" << this << "]: Run: Shutting down backend.");
      backend_ptr->shutdown();
    }
    conns.join_all();
    FLOW_LOG_INFO("Control server [" << this << "]: Run: Done.");
  };

  start_backend_if_needed();

  Error_code accept_err_code;
  while (true)
  {
    auto conn = listener->accept(&accept_err_code);
    if (accept_err_code)
    {
      break;
    }
    // else

    FLOW_LOG_TRACE("Control server [" << this << "]: Run: Accepted connection [" << conn.get() << "]; "
                   "[" << conns.n_conns() << "] others open.");
    conns.serve(std::move(conn));
  }

  if (cancellation->canceled())
  {
    FLOW_LOG_INFO("Control server [" << this << "]: Run: Listener stopped due to cancellation "
                  "([" << accept_err_code << "] [" << accept_err_code.message() << "]).");
    err_code->clear();
    return;
  }
  // else
  FLOW_LOG_WARNING("Control server [" << this << "]: Run: Listener failed: "
                   "[" << accept_err_code << "] [" << accept_err_code.message() << "].");
  *err_code = accept_err_code;
} // Control_server::run()

void Control_server::serve_conn(Conn* conn)
{
  assert(conn);

  Error_code identity_err_code;
  const auto identity = m_identity_resolver->resolve(*conn, &identity_err_code);
  if (identity_err_code)
  {
    FLOW_LOG_WARNING("Control server [" << this << "]: Connection [" << conn << "]: Identity resolution failed "
                     "([" << identity_err_code << "] [" << identity_err_code.message() << "]); its requests will be "
                     "refused.");
  }
  else
  {
    FLOW_LOG_INFO("Control server [" << this << "]: Connection [" << conn << "]: Identity is [" << *identity << "].");
  }

  Error_code io_err_code;
  while (true)
  {
    Request req;
    if (!conn->read_request(&req, &io_err_code))
    {
      if (io_err_code)
      {
        FLOW_LOG_TRACE("Control server [" << this << "]: Connection [" << conn << "]: Closing on read error "
                       "[" << io_err_code << "] [" << io_err_code.message() << "].");
      }
      break;
    }
    // else

    Response rsp;
    handle_request(req, identity, identity_err_code, &rsp);
    rsp.prepare_payload();

    FLOW_LOG_TRACE("Control server [" << this << "]: Connection [" << conn << "]: "
                   "[" << req.method_string() << ' ' << req.target() << "] => [" << rsp.result_int() << "].");

    conn->write_response(&rsp, &io_err_code);
    if (io_err_code)
    {
      FLOW_LOG_TRACE("Control server [" << this << "]: Connection [" << conn << "]: Closing on write error "
                     "[" << io_err_code << "] [" << io_err_code.message() << "].");
      break;
    }
    // else
    if (!rsp.keep_alive())
    {
      break;
    }
  } // while (true)
} // Control_server::serve_conn()

void Control_server::handle_request(const Request& req, const Conn_identity::Ptr& identity,
                                    const Error_code& identity_err_code, Response* rsp)
{
  using boost::beast::http::status;
  using boost::beast::http::verb;
  using boost::beast::http::field;
  using boost::algorithm::starts_with;

  rsp->version(req.version());
  rsp->keep_alive(req.keep_alive());
  rsp->result(status::ok);

  if (req.method() == verb::connect)
  {
    respond_error(rsp, status::method_not_allowed, "bad method for platform");
    return;
  }
  // else

  const auto backend_ptr = backend();
  if (!backend_ptr)
  {
    const Error_code no_backend_err_code = error::Code::S_NO_BACKEND;
    FLOW_LOG_WARNING("Control server [" << this << "]: Refusing [" << req.method_string() << ' ' << req.target()
                     << "]: [" << no_backend_err_code << "] [" << no_backend_err_code.message() << "].");
    respond_error(rsp, status::service_unavailable, "no backend");
    return;
  }
  // else

  if (identity_err_code)
  {
    respond_error(rsp, status::unauthorized, identity_err_code.message());
    return;
  }
  // else
  if (!identity)
  {
    respond_error(rsp, status::internal_server_error, "internal error: no connection identity");
    return;
  }
  // else

  std::string denial_msg;
  Error_code add_err_code;
  const auto req_id = m_session_tracker.add_active_request(identity, backend_ptr, &denial_msg, &add_err_code);
  if (add_err_code)
  {
    respond_error(rsp, status::unauthorized, denial_msg.empty() ? add_err_code.message() : denial_msg);
    return;
  }
  // else
  const Session_tracker::Active_request active_req(&m_session_tracker, req_id, backend_ptr);

  const auto target = req.target();
  if (starts_with(target, "/localapi/"))
  {
    if (!m_api_handler)
    {
      respond_error(rsp, status::not_found, "404 page not found");
      return;
    }
    // else

    Api_context ctx;
    ctx.m_backend = backend_ptr;
    ctx.m_backend_log_id = m_config.m_backend_log_id;
    ctx.m_identity = identity;
    ctx.m_permissions = local_api_permissions(*identity);
    FLOW_LOG_TRACE("Control server [" << this << "]: Request [" << req_id << "] to local API with "
                   "permissions [" << ctx.m_permissions << "].");
    m_api_handler->handle(ctx, req, rsp);
    return;
  }
  // else

  if (target != "/")
  {
    respond_error(rsp, status::not_found, "404 page not found");
    return;
  }
  // else

  if (m_config.m_serve_status_page)
  {
    serve_status_page(req, rsp);
    return;
  }
  // else
  rsp->set(field::content_type, "text/html; charset=utf-8");
  rsp->body() = S_ROOT_PAGE_HTML;
} // Control_server::handle_request()

Permissions Control_server::local_api_permissions(const Conn_identity& identity) const
{
  Permission_inputs inputs;
  inputs.m_platform = m_config.m_platform;
  inputs.m_transport_kind = identity.m_transport_kind;
  inputs.m_peer_creds = identity.m_peer_creds;
  inputs.m_permit_cert_uid = m_config.m_permit_cert_uid;
  if (m_config.m_platform == Platform::S_WINDOWS)
  {
    // Re-checked (not taken from admission): the policy may have changed since.
    inputs.m_authorized = m_session_tracker.check_conn_identity(identity)
                            && (!must_backend().check_connection_allowed(identity));
  }
  else if (m_config.m_platform != Platform::S_JS)
  {
    inputs.m_operator_user_id = must_backend().operator_user_id();
  }
  return compute_permissions(inputs);
}

void Control_server::serve_status_page(const Request& req, Response* rsp) const
{
  using boost::beast::http::status;
  using boost::beast::http::field;

  const auto host_it = req.find(field::host);
  const auto host = (host_it == req.end()) ? util::String_view() : util::String_view(host_it->value().data(),
                                                                                      host_it->value().size());
  if (!is_local_host(host))
  {
    FLOW_LOG_WARNING("Control server [" << this << "]: Status page requested with non-local Host [" << host << "]; "
                     "refusing.");
    respond_error(rsp, status::forbidden, "invalid host");
    return;
  }
  // else

  rsp->set("Content-Security-Policy", S_STATUS_PAGE_CSP);
  rsp->set("X-Frame-Options", "DENY");
  rsp->set("X-Content-Type-Options", "nosniff");
  rsp->set(field::content_type, "text/html; charset=utf-8");
  rsp->body() = must_backend().status_html();
}

const Server_config& Control_server::config() const
{
  return m_config;
}

const Session_tracker& Control_server::session_tracker() const
{
  return m_session_tracker;
}

} // namespace ctl::session
