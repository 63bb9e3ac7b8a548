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
#include "ctl/session/detail/conn_thread_set.hpp"

namespace ctl::session
{

// Implementations.

Conn_thread_set::Conn_thread_set(flow::log::Logger* logger_ptr, Serve_func&& serve_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_serve_func(std::move(serve_func)),
  m_n_live(0),
  m_last_id(0),
  m_canceled(false)
{
  // Nothing else.
}

Conn_thread_set::~Conn_thread_set()
{
  cancel_all();
  join_all();
}

void Conn_thread_set::serve(std::unique_ptr<Conn>&& conn)
{
  using flow::async::Single_thread_task_loop;
  using flow::util::ostream_op_string;

  assert(conn);

  reap_done();

  Conn* const conn_ptr = conn.get();
  Single_thread_task_loop* thread;
  conn_id_t id;
  bool canceled;
  {
    Lock_guard lock(m_mutex);
    id = ++m_last_id;
    auto& served = m_conns[id];
    served.m_conn.reset(conn.release());
    served.m_thread = std::make_unique<Single_thread_task_loop>(get_logger(), ostream_op_string("ctl_conn-", id));
    thread = served.m_thread.get();
    canceled = m_canceled;
    ++m_n_live;
  }
  // The entry (hence *conn_ptr and *thread) stays until this thread reaps it.

  if (canceled)
  {
    conn_ptr->cancel();
  }

  FLOW_LOG_TRACE("Conn threads [" << this << "]: Serving connection [" << conn_ptr << "] as [" << id << "].");
  thread->start();
  thread->post([this, id, conn_ptr]() { serve_and_retire(id, conn_ptr); });
}

void Conn_thread_set::serve_and_retire(conn_id_t id, Conn* conn)
{
  m_serve_func(conn);

  boost::shared_ptr<Conn> done_conn;
  {
    Lock_guard lock(m_mutex);
    const auto it = m_conns.find(id);
    assert(it != m_conns.end());
    done_conn.swap(it->second.m_conn);
    m_done_ids.push_back(id);
    --m_n_live;
  }

  FLOW_LOG_TRACE("Conn threads [" << this << "]: Connection [" << id << "] done; closing it.");
  done_conn.reset();
}

void Conn_thread_set::cancel_all()
{
  Lock_guard lock(m_mutex);
  if (!m_canceled)
  {
    FLOW_LOG_INFO("Conn threads [" << this << "]: Canceling reads on [" << m_n_live << "] open connection(s).");
    m_canceled = true;
  }
  for (const auto& id_and_served : m_conns)
  {
    if (id_and_served.second.m_conn)
    {
      id_and_served.second.m_conn->cancel();
    }
  }
}

void Conn_thread_set::join_all()
{
  using flow::async::Single_thread_task_loop;

  std::vector<Single_thread_task_loop*> threads;
  {
    Lock_guard lock(m_mutex);
    threads.reserve(m_conns.size());
    for (const auto& id_and_served : m_conns)
    {
      threads.push_back(id_and_served.second.m_thread.get());
    }
  }

  if (!threads.empty())
  {
    FLOW_LOG_INFO("Conn threads [" << this << "]: Joining [" << threads.size() << "] connection thread(s).");
  }
  for (const auto thread : threads)
  {
    thread->stop(); // Lets the serving function (if started) finish; lock not held, as it needs the lock at the end.
  }

  std::map<conn_id_t, Served_conn> conns;
  {
    Lock_guard lock(m_mutex);
    conns.swap(m_conns);
    m_done_ids.clear();
    m_n_live = 0;
  }
  // `conns` goes away here: closes any connection whose serving never began.
}

size_t Conn_thread_set::n_conns() const
{
  Lock_guard lock(m_mutex);
  return m_n_live;
}

void Conn_thread_set::reap_done()
{
  std::vector<Served_conn> done;
  {
    Lock_guard lock(m_mutex);
    for (const auto id : m_done_ids)
    {
      const auto it = m_conns.find(id);
      assert(it != m_conns.end());
      done.push_back(std::move(it->second));
      m_conns.erase(it);
    }
    m_done_ids.clear();
  }

  for (auto& served : done)
  {
    served.m_thread->stop(); // Its only task is done (or finishing); so this is a quick join.
  }
}

} // namespace ctl::session
