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
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <memory>

namespace ctl::session
{

// Types.

/// A request as read off a Conn: an HTTP/1.x request with its body in memory.
using Request = boost::beast::http::request<boost::beast::http::string_body>;

/// A response as written to a Conn.
using Response = boost::beast::http::response<boost::beast::http::string_body>;

/**
 * One accepted local connection, as the transport provider hands it to Control_server.
 *
 * This is the seam between ctl::session and whatever transport is actually in use (ctl::transport supplies
 * the Unix-domain-socket one).  Besides request/response I/O the session layer needs exactly one thing from a
 * connection: enough information for an Identity_resolver to tell who is on the other end.  A connection
 * exposes that as either (or neither) of:
 *   - a native named-pipe handle (native_pipe_handle()), through which the OS can report the client PID;
 *   - OS peer credentials embedded in the channel (peer_process_credentials()).
 *
 * ### Thread safety ###
 * A given Conn is used by one thread at a time: Control_server serves each connection in its own thread.  The
 * exception is cancel(), which Control_server calls from its run() thread on the way out.
 */
class Conn
{
public:
  // Constructors/destructor.

  /// Closes the connection (if still open).
  virtual ~Conn();

  // Methods.

  /**
   * Kind of channel this is.
   * @return See above.
   */
  virtual Transport_kind transport_kind() const = 0;

  /**
   * The native handle of the named pipe backing this connection; or empty if it is not pipe-backed.
   * @return See above.
   */
  virtual std::optional<util::pipe_handle_t> native_pipe_handle() const = 0;

  /**
   * OS-reported credentials of the process at the other end; or empty if the channel does not carry them
   * (or the OS declined to report them).
   *
   * @return See above.
   */
  virtual std::optional<util::Process_credentials> peer_process_credentials() const = 0;

  /**
   * Reads the next request, blocking until it has arrived in its entirety, the other side closes the
   * connection, an error occurs, or the connection's idle timeout expires.
   *
   * @param target
   *        Default-constructed request to fill out.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error codes are the transport's own
   *        (including a timeout code on idle expiration).  Orderly end-of-stream is *not* an error.
   * @return `true` if `*target` is a request; `false` on end-of-stream or error.
   */
  virtual bool read_request(Request* target, Error_code* err_code = 0) = 0;

  /**
   * Writes a response, blocking until written or an error occurs.  If the response is not keep-alive, the
   * sending direction of the connection is shut down afterwards.
   *
   * @param rsp
   *        The response; payload should be prepared.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Error codes are the transport's own.
   */
  virtual void write_response(Response* rsp, Error_code* err_code = 0) = 0;

  /**
   * Stops reading: a pending read_request() returns promptly, and any future one returns immediately, `false`
   * with `boost::asio::error::operation_aborted`.  A request already read may still be answered by
   * write_response().
   *
   * Unlike the other methods, this one may be called from any thread, concurrently with the thread serving the
   * connection.  Idempotent; non-blocking.
   */
  virtual void cancel() = 0;
}; // class Conn

/**
 * A listening channel which produces Conn objects; the transport provider side of Control_server::run().
 *
 * Construction -- including binding a local address and setting up access control on it -- is the provider's
 * business.  Control_server needs only accept() and a way to unblock it from another thread (close()).
 */
class Listener
{
public:
  // Constructors/destructor.

  /// Stops listening (if not already stopped).
  virtual ~Listener();

  // Methods.

  /**
   * Blocks until a connection arrives, returning it; or until close() is called or an error occurs.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  If close() has been called (before or during
   *        this call), emits `boost::asio::error::operation_aborted`; otherwise the transport's own codes.
   * @return The connection; or null if and only if an error is emitted.
   */
  virtual std::unique_ptr<Conn> accept(Error_code* err_code = 0) = 0;

  /**
   * Stops listening: a pending or future accept() fails.  Thread-safe: may be called from any thread,
   * concurrently with accept(); idempotent; non-blocking.
   */
  virtual void close() = 0;
}; // class Listener

} // namespace ctl::session
