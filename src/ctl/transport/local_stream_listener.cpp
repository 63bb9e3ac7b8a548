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
#include "ctl/transport/local_stream_listener.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/http/error.hpp>
#include <chrono>
#include <sys/socket.h>

namespace ctl::transport
{

// Local_stream_conn implementations.

Local_stream_conn::Local_stream_conn(flow::log::Logger* logger_ptr, util::Fine_duration idle_timeout) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_idle_timeout(idle_timeout),
  m_stream(m_task_engine),
  m_canceled(false)
{
  // Nothing else.
}

Local_stream_conn::~Local_stream_conn()
{
  Error_code sink;
  m_stream.socket().close(sink); // Nothing useful to do about an error here.
  FLOW_LOG_TRACE("Local conn [" << this << "]: Closed.");
}

void Local_stream_conn::on_accepted()
{
  using boost::system::system_category;

  // SO_PEERCRED reports the peer's credentials as of connect(); so good for the life of the connection.
  ::ucred cred;
  ::socklen_t cred_size = sizeof(cred);
  if (::getsockopt(m_stream.socket().native_handle(), SOL_SOCKET, SO_PEERCRED, &cred, &cred_size) == -1)
  {
    const Error_code sys_err_code(errno, system_category());
    FLOW_LOG_WARNING("Local conn [" << this << "]: Accepted; but could not obtain peer credentials: "
                     "[" << sys_err_code << "] [" << sys_err_code.message() << "].  Continuing without them.");
    return;
  }
  // else
  m_peer_creds.emplace(cred.pid, cred.uid, cred.gid);
  FLOW_LOG_TRACE("Local conn [" << this << "]: Accepted; peer credentials [" << *m_peer_creds << "].");
}

session::Transport_kind Local_stream_conn::transport_kind() const
{
  return session::Transport_kind::S_DOMAIN_SOCKET;
}

std::optional<util::pipe_handle_t> Local_stream_conn::native_pipe_handle() const
{
  return std::nullopt;
}

std::optional<util::Process_credentials> Local_stream_conn::peer_process_credentials() const
{
  return m_peer_creds;
}

bool Local_stream_conn::read_request(session::Request* target, Error_code* err_code)
{
  namespace http = boost::beast::http;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Local_stream_conn::read_request, target, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(target);

  if (m_canceled)
  {
    *err_code = boost::asio::error::operation_aborted;
    return false;
  }
  // else

  Error_code result;
  m_stream.expires_after(std::chrono::nanoseconds(m_idle_timeout.count()));
  http::async_read(m_stream, m_read_buf, *target,
                   [&result](const Error_code& async_err_code, size_t) { result = async_err_code; });
  run_until_done(); // A cancel() posted meanwhile runs here too; the read then sees end-of-stream.

  if (result && m_canceled)
  {
    FLOW_LOG_TRACE("Local conn [" << this << "]: Read stopped by cancellation.");
    *err_code = boost::asio::error::operation_aborted;
    return false;
  }
  // else
  if (result == http::error::end_of_stream)
  {
    FLOW_LOG_TRACE("Local conn [" << this << "]: Peer closed the connection.");
    err_code->clear();
    return false;
  }
  // else
  if (result)
  {
    FLOW_LOG_TRACE("Local conn [" << this << "]: Read failed: [" << result << "] [" << result.message() << "].");
    *err_code = result;
    return false;
  }
  // else
  err_code->clear();
  return true;
} // Local_stream_conn::read_request()

void Local_stream_conn::write_response(session::Response* rsp, Error_code* err_code)
{
  namespace http = boost::beast::http;
  using boost::asio::local::stream_protocol;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write_response(rsp, actual_err_code); },
         err_code, "Local_stream_conn::write_response()"))
  {
    return;
  }
  // else

  assert(rsp);

  Error_code result;
  m_stream.expires_after(std::chrono::nanoseconds(m_idle_timeout.count()));
  http::async_write(m_stream, *rsp,
                    [&result](const Error_code& async_err_code, size_t) { result = async_err_code; });
  run_until_done();

  if (result)
  {
    FLOW_LOG_TRACE("Local conn [" << this << "]: Write failed: [" << result << "] [" << result.message() << "].");
    *err_code = result;
    return;
  }
  // else

  if (!rsp->keep_alive())
  {
    Error_code shutdown_err_code;
    m_stream.socket().shutdown(stream_protocol::socket::shutdown_send, shutdown_err_code);
    if (shutdown_err_code)
    {
      FLOW_LOG_TRACE("Local conn [" << this << "]: Shutdown of sending direction failed: "
                     "[" << shutdown_err_code << "] [" << shutdown_err_code.message() << "]; ignoring.");
    }
  }
  err_code->clear();
} // Local_stream_conn::write_response()

void Local_stream_conn::cancel()
{
  using boost::asio::local::stream_protocol;

  if (m_canceled.exchange(true))
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Local conn [" << this << "]: Canceling reads.");
  // m_stream is not thread-safe: shut it down in the thread running (or next to run) m_task_engine.
  boost::asio::post(m_task_engine, [this]()
  {
    Error_code sink;
    m_stream.socket().shutdown(stream_protocol::socket::shutdown_receive, sink); // Not connected is fine.
  });
}

void Local_stream_conn::run_until_done()
{
  m_task_engine.restart();
  m_task_engine.run();
}

// Local_stream_listener implementations.

Local_stream_listener::Local_stream_listener(flow::log::Logger* logger_ptr, const fs::path& path,
                                             util::Fine_duration conn_idle_timeout, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_path(path),
  m_conn_idle_timeout(conn_idle_timeout),
  m_acceptor(m_task_engine),
  m_closed(false)
{
  using flow::error::Runtime_error;
  using boost::asio::local::stream_protocol;

  Error_code our_err_code;

  // A previous process may have left its socket file behind; bind() would fail on it.
  fs::remove(m_path, our_err_code);
  if (our_err_code)
  {
    FLOW_LOG_WARNING("Local listener [" << this << "]: Could not remove stale socket file [" << m_path << "]: "
                     "[" << our_err_code << "] [" << our_err_code.message() << "]; will try to bind anyway.");
    our_err_code.clear();
  }

  const stream_protocol::endpoint endpoint(m_path.string());
  m_acceptor.open(endpoint.protocol(), our_err_code);
  if (!our_err_code)
  {
    m_acceptor.bind(endpoint, our_err_code);
  }
  if (!our_err_code)
  {
    m_acceptor.listen(stream_protocol::acceptor::max_listen_connections, our_err_code);
  }
  if (!our_err_code)
  {
    fs::permissions(m_path,
                    fs::owner_read | fs::owner_write | fs::group_read | fs::group_write
                      | fs::others_read | fs::others_write,
                    our_err_code);
  }

  if (our_err_code)
  {
    FLOW_LOG_WARNING("Local listener [" << this << "]: Could not listen at [" << m_path << "]: "
                     "[" << our_err_code << "] [" << our_err_code.message() << "].");
    m_closed = true;
    if (!err_code)
    {
      throw Runtime_error(our_err_code, FLOW_UTIL_WHERE_AM_I_STR());
    }
    // else
    *err_code = our_err_code;
    return;
  }
  // else

  FLOW_LOG_INFO("Local listener [" << this << "]: Listening at [" << m_path << "].");
  if (err_code)
  {
    err_code->clear();
  }
} // Local_stream_listener::Local_stream_listener()

Local_stream_listener::~Local_stream_listener()
{
  Error_code sink;
  m_acceptor.close(sink);
  fs::remove(m_path, sink); // Nothing useful to do about an error here.
  FLOW_LOG_INFO("Local listener [" << this << "]: Stopped listening at [" << m_path << "].");
}

std::unique_ptr<session::Conn> Local_stream_listener::accept(Error_code* err_code)
{
  using boost::asio::error::operation_aborted;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(std::unique_ptr<session::Conn>, Local_stream_listener::accept, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_closed)
  {
    *err_code = operation_aborted;
    return nullptr;
  }
  // else

  std::unique_ptr<Local_stream_conn> conn(new Local_stream_conn(get_logger(), m_conn_idle_timeout));

  Error_code result;
  m_acceptor.async_accept(conn->m_stream.socket(),
                          [&result](const Error_code& async_err_code) { result = async_err_code; });
  // This also executes any close() posted meanwhile; which aborts the accept.
  m_task_engine.restart();
  m_task_engine.run();

  if (m_closed)
  {
    *err_code = operation_aborted;
    return nullptr;
  }
  // else
  if (result)
  {
    FLOW_LOG_WARNING("Local listener [" << this << "]: Accept failed: "
                     "[" << result << "] [" << result.message() << "].");
    *err_code = result;
    return nullptr;
  }
  // else

  conn->on_accepted();
  err_code->clear();
  return conn;
} // Local_stream_listener::accept()

void Local_stream_listener::close()
{
  if (m_closed.exchange(true))
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Local listener [" << this << "]: Closing.");
  // m_acceptor is not thread-safe: close it in the thread running (or next to run) m_task_engine.
  boost::asio::post(m_task_engine, [this]()
  {
    Error_code sink;
    m_acceptor.close(sink);
  });
}

const fs::path& Local_stream_listener::path() const
{
  return m_path;
}

} // namespace ctl::transport
