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
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <map>
#include <vector>

namespace ctl::session
{

// Types.

/**
 * The connections being served by a Control_server::run(), each in its own thread, so that a connection idling
 * between keep-alive requests (or parked in a long API call) never holds up any other connection.
 *
 * serve() starts a thread (a `flow::async::Single_thread_task_loop`) running the serving function on the Conn.
 * When that returns, the Conn is destroyed (closing it) right away in that thread; the thread itself is joined
 * later, by the next serve() or by join_all().  cancel_all() makes every connection still being served stop
 * reading (Conn::cancel()), so that the serving functions return once any request in flight is answered.
 *
 * ### Thread safety ###
 * serve(), cancel_all(), join_all() are to be called from one thread (the run() thread).  n_conns() may be called
 * from any thread.
 */
class Conn_thread_set :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Serves a connection until done with it.
  using Serve_func = Function<void (Conn* conn)>;

  // Constructors/destructor.

  /**
   * Constructs an empty set.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param serve_func
   *        Invoked once per serve()d Conn, in that Conn's thread.
   */
  explicit Conn_thread_set(flow::log::Logger* logger_ptr, Serve_func&& serve_func);

  /// Does cancel_all() and join_all().
  ~Conn_thread_set();

  // Methods.

  /**
   * Starts serving the given connection in a new thread; and joins the threads of connections already done.
   *
   * @param conn
   *        Connection.  Must not be null.
   */
  void serve(std::unique_ptr<Conn>&& conn);

  /// Conn::cancel() on each connection still being served; and on any serve()d subsequently.
  void cancel_all();

  /// Blocks until every connection is done; joins all threads.
  void join_all();

  /**
   * Number of connections still being served.
   * @return See above.
   */
  size_t n_conns() const;

private:
  // Types.

  /// Short-hand for our mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for our lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// One connection and its thread.
  struct Served_conn
  {
    /// The connection; null once it is done.
    boost::shared_ptr<Conn> m_conn;
    /// The thread serving it.
    std::unique_ptr<flow::async::Single_thread_task_loop> m_thread;
  };

  /// Key in #m_conns.
  using conn_id_t = uint64_t;

  // Methods.

  /**
   * Serving thread body: serves `conn`; then destroys it and marks `id` done.
   *
   * @param id
   *        Key in #m_conns.
   * @param conn
   *        The connection; owned by #m_conns until done.
   */
  void serve_and_retire(conn_id_t id, Conn* conn);

  /// Joins and forgets the threads of done connections.
  void reap_done();

  // Data.

  /// See ctor.
  const Serve_func m_serve_func;

  /// Protects the following.
  mutable Mutex m_mutex;

  /// The connections, done or not, whose threads have not yet been joined.
  std::map<conn_id_t, Served_conn> m_conns;

  /// Keys of #m_conns entries whose connections are done.
  std::vector<conn_id_t> m_done_ids;

  /// Number of #m_conns entries whose connections are not done.
  size_t m_n_live;

  /// Last key used in #m_conns.
  conn_id_t m_last_id;

  /// Whether cancel_all() has been called.
  bool m_canceled;
}; // class Conn_thread_set

} // namespace ctl::session
