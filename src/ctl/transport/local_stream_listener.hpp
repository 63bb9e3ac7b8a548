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

#include "ctl/session/conn.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core/basic_stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>

/**
 * Flow-Ctl module providing a concrete local transport for ctl::session: Unix domain stream sockets carrying
 * HTTP/1.1.  See Local_stream_listener and Local_stream_conn.
 */
namespace ctl::transport
{

// Types.

/**
 * A ctl::session::Conn over an accepted Unix-domain stream socket: blocking HTTP/1.1 request reads and response
 * writes, each bounded by the connection's idle timeout; peer credentials as reported by the kernel at accept time.
 *
 * Objects are created only by Local_stream_listener::accept().  Each owns its own `Task_engine` (boost.asio
 * `io_context`) on which it runs its own I/O synchronously in the calling thread; so distinct connections can be
 * served by distinct threads with no coordination.
 */
class Local_stream_conn :
  public session::Conn,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Closes the socket.
  ~Local_stream_conn() override;

  // Methods.

  /**
   * Implements session::Conn API: always Transport_kind::S_DOMAIN_SOCKET.
   * @return See above.
   */
  session::Transport_kind transport_kind() const override;

  /**
   * Implements session::Conn API: always empty.
   * @return See above.
   */
  std::optional<util::pipe_handle_t> native_pipe_handle() const override;

  /**
   * Implements session::Conn API: the peer's credentials obtained at accept time, if the kernel reported them.
   * @return See above.
   */
  std::optional<util::Process_credentials> peer_process_credentials() const override;

  /**
   * Implements session::Conn API.  Idle expiration is reported as `boost::beast::error::timeout`.
   *
   * @param target
   *        See session::Conn.
   * @param err_code
   *        See session::Conn.
   * @return See session::Conn.
   */
  bool read_request(session::Request* target, Error_code* err_code = 0) override;

  /**
   * Implements session::Conn API.
   *
   * @param rsp
   *        See session::Conn.
   * @param err_code
   *        See session::Conn.
   */
  void write_response(session::Response* rsp, Error_code* err_code = 0) override;

  /**
   * Implements session::Conn API: shuts down the receiving direction of the socket, in the thread doing I/O on
   * #m_task_engine (now or next).
   */
  void cancel() override;

private:
  // Friends.

  /// Creates us.
  friend class Local_stream_listener;

  // Types.

  /// The socket stream with per-operation expiration.
  using Stream = boost::beast::basic_stream<boost::asio::local::stream_protocol>;

  // Constructors.

  /**
   * Constructs an unconnected object; Local_stream_listener then accepts into its socket and calls on_accepted().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param idle_timeout
   *        Each read or write must complete within this long.
   */
  explicit Local_stream_conn(flow::log::Logger* logger_ptr, util::Fine_duration idle_timeout);

  // Methods.

  /// Obtains the peer's credentials from the now-connected socket.
  void on_accepted();

  /**
   * Runs #m_task_engine until the operation just initiated on it has completed.
   */
  void run_until_done();

  // Data.

  /// See ctor.
  const util::Fine_duration m_idle_timeout;

  /// Executes our I/O, in whichever thread is calling read_request() or write_response().
  flow::util::Task_engine m_task_engine;

  /// The connection.
  Stream m_stream;

  /// Read buffer; may hold the beginning of the next pipelined request between read_request() calls.
  boost::beast::flat_buffer m_read_buf;

  /// See peer_process_credentials().
  std::optional<util::Process_credentials> m_peer_creds;

  /// Whether cancel() has been called.
  std::atomic<bool> m_canceled;
}; // class Local_stream_conn

/**
 * A ctl::session::Listener on a Unix-domain stream socket bound at a file system path.
 *
 * accept() blocks the calling thread; close() may be called from any other thread to make it (and all future calls)
 * fail with `boost::asio::error::operation_aborted`.
 *
 * The socket file is created (after removing any stale one) by the constructor, with permissions allowing all
 * local users to connect (per-connection permissions are ctl::session's business, based on peer credentials), and
 * removed by the destructor.
 */
class Local_stream_listener :
  public session::Listener,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Binds and listens.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently (also passed to accepted connections).
   * @param path
   *        Socket file path.
   * @param conn_idle_timeout
   *        Passed to accepted connections; see Local_stream_conn.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error codes are system ones.  On error
   *        the object is useless: accept() will fail.
   */
  explicit Local_stream_listener(flow::log::Logger* logger_ptr, const fs::path& path,
                                 util::Fine_duration conn_idle_timeout, Error_code* err_code = 0);

  /// Stops listening and removes the socket file.
  ~Local_stream_listener() override;

  // Methods.

  /**
   * Implements session::Listener API.
   *
   * @param err_code
   *        See session::Listener.
   * @return See session::Listener.
   */
  std::unique_ptr<session::Conn> accept(Error_code* err_code = 0) override;

  /// Implements session::Listener API.
  void close() override;

  /**
   * Socket file path.
   * @return See above.
   */
  const fs::path& path() const;

private:
  // Data.

  /// See ctor.
  const fs::path m_path;

  /// See ctor.
  const util::Fine_duration m_conn_idle_timeout;

  /// Executes accepts, in the thread calling accept(); and acceptor closing, whichever thread calls close().
  flow::util::Task_engine m_task_engine;

  /// The listening socket.
  boost::asio::local::stream_protocol::acceptor m_acceptor;

  /// Whether close() has been called (or construction failed).
  std::atomic<bool> m_closed;
}; // class Local_stream_listener

} // namespace ctl::transport
