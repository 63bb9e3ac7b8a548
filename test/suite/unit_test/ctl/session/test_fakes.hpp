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

#include "ctl/session/api_handler.hpp"
#include "ctl/session/error.hpp"
#include "ctl/session/identity_resolver.hpp"
#include <flow/log/config.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <boost/asio/error.hpp>
#include <boost/make_shared.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <vector>

namespace ctl::session::test
{

// Types.

/// Holds the Config of a Test_logger; a separate base so it is constructed before the logger.
struct Test_log_config
{
  /// Config.
  flow::log::Config m_config;

  /**
   * Config with the given default verbosity.
   * @param sev
   *        Verbosity.
   */
  explicit Test_log_config(flow::log::Sev sev) :
    m_config(sev)
  {
  }
};

/// Console logger for unit tests: WARNING and more severe by default, so failures come with context.
class Test_logger :
  private Test_log_config,
  public flow::log::Simple_ostream_logger
{
public:
  /**
   * Constructor.
   * @param sev
   *        Verbosity.
   */
  explicit Test_logger(flow::log::Sev sev = flow::log::Sev::S_WARNING) :
    Test_log_config(sev),
    flow::log::Simple_ostream_logger(&m_config, std::cout, std::cerr)
  {
  }
};

/// Backend recording what was done to it.
class Fake_backend : public Backend
{
public:
  Error_code check_connection_allowed(const Conn_identity&) override
  {
    return m_policy_err_code;
  }

  void set_current_user_id(const std::string& user_id) override
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_current_user_ids.push_back(user_id);
  }

  void reset_for_client_disconnect() override
  {
    if (!m_on_reset.empty())
    {
      m_on_reset();
    }
    ++m_n_resets;
  }

  bool in_server_mode() override
  {
    return m_server_mode;
  }

  bool prefs_valid() override
  {
    return m_prefs_valid;
  }

  void start(const Start_options& opts) override
  {
    m_start_log_id = opts.m_backend_log_id;
    ++m_n_starts;
  }

  void shutdown() override
  {
    ++m_n_shutdowns;
    if (!m_on_shutdown.empty())
    {
      m_on_shutdown();
    }
  }

  std::string operator_user_id() override
  {
    return m_operator_user_id;
  }

  std::string status_html() override
  {
    return "<p>status</p>";
  }

  /// User IDs given to set_current_user_id(), in order.
  std::vector<std::string> current_user_ids() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_user_ids;
  }

  /// Returned by check_connection_allowed().
  Error_code m_policy_err_code;
  /// Returned by in_server_mode().
  std::atomic<bool> m_server_mode{false};
  /// Returned by prefs_valid().
  std::atomic<bool> m_prefs_valid{true};
  /// Returned by operator_user_id().
  std::string m_operator_user_id;
  /// If not empty, invoked at the start of each reset.
  Function<void ()> m_on_reset;
  /// If not empty, invoked at the end of each shutdown.
  Function<void ()> m_on_shutdown;

  /// Counters.
  std::atomic<int> m_n_resets{0};
  std::atomic<int> m_n_starts{0};
  std::atomic<int> m_n_shutdowns{0};
  std::string m_start_log_id;

private:
  mutable std::mutex m_mutex;
  std::vector<std::string> m_current_user_ids;
}; // class Fake_backend

/// Counts connections the server is done with.
class Served_counter
{
public:
  void increment()
  {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      ++m_n_served;
    }
    m_cond.notify_all();
  }

  /// Blocks until at least `n` connections are done.
  void wait_for(size_t n)
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cond.wait(lock, [&]() { return m_n_served >= n; });
  }

private:
  std::mutex m_mutex;
  std::condition_variable m_cond;
  size_t m_n_served = 0;
};

/// What a Fake_conn was sent; shared so that it survives the Conn.
struct Conn_record
{
  /// Blocks until at least `n` responses have been written.
  void wait_for_responses(size_t n)
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cond.wait(lock, [&]() { return m_responses.size() >= n; });
  }

  std::mutex m_mutex;
  std::condition_variable m_cond;
  std::vector<Response> m_responses;
  bool m_canceled = false;
};

/**
 * Conn serving a fixed script of requests; then end-of-stream, or (if #m_hold_open) idling like a keep-alive
 * client until canceled.
 */
class Fake_conn : public Conn
{
public:
  explicit Fake_conn(Transport_kind kind = Transport_kind::S_DOMAIN_SOCKET) :
    m_kind(kind),
    m_record(boost::make_shared<Conn_record>())
  {
  }

  /// The server is done with us.
  ~Fake_conn() override
  {
    if (m_served_counter)
    {
      m_served_counter->increment();
    }
  }

  Transport_kind transport_kind() const override
  {
    return m_kind;
  }

  std::optional<util::pipe_handle_t> native_pipe_handle() const override
  {
    return m_pipe_handle;
  }

  std::optional<util::Process_credentials> peer_process_credentials() const override
  {
    return m_peer_creds;
  }

  bool read_request(Request* target, Error_code* err_code) override
  {
    if (err_code)
    {
      err_code->clear();
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_requests.empty() && m_hold_open)
    {
      m_cond.wait(lock, [&]() { return m_canceled; });
    }
    if (m_canceled)
    {
      if (err_code)
      {
        *err_code = boost::asio::error::operation_aborted;
      }
      return false;
    }
    if (m_requests.empty())
    {
      return false;
    }
    *target = std::move(m_requests.front());
    m_requests.pop_front();
    return true;
  }

  void write_response(Response* rsp, Error_code* err_code) override
  {
    if (err_code)
    {
      err_code->clear();
    }
    {
      std::lock_guard<std::mutex> lock(m_record->m_mutex);
      m_record->m_responses.push_back(*rsp);
    }
    m_record->m_cond.notify_all();
  }

  void cancel() override
  {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_canceled = true;
    }
    {
      std::lock_guard<std::mutex> lock(m_record->m_mutex);
      m_record->m_canceled = true;
    }
    m_cond.notify_all();
  }

  /// Appends a GET of `target` to the script.
  void add_get(util::String_view target, bool keep_alive = true)
  {
    Request req(boost::beast::http::verb::get, std::string(target), 11);
    req.keep_alive(keep_alive);
    m_requests.push_back(std::move(req));
  }

  const Transport_kind m_kind;
  std::optional<util::pipe_handle_t> m_pipe_handle;
  std::optional<util::Process_credentials> m_peer_creds;
  std::deque<Request> m_requests;
  boost::shared_ptr<Conn_record> m_record;
  Served_counter* m_served_counter = nullptr;
  /// Whether, once the script is done, to wait for cancel() instead of reporting end-of-stream.
  bool m_hold_open = false;

private:
  std::mutex m_mutex;
  std::condition_variable m_cond;
  bool m_canceled = false;
}; // class Fake_conn

/**
 * Listener handing out a fixed list of connections; then either (if #m_end_err_code) failing with that error once
 * they have all been served, or blocking until close().
 */
class Fake_listener : public Listener
{
public:
  void add_conn(std::unique_ptr<Fake_conn>&& conn)
  {
    conn->m_served_counter = &m_served_counter;
    m_conns.push_back(std::move(conn));
  }

  std::unique_ptr<Conn> accept(Error_code* err_code) override
  {
    if (!m_conns.empty())
    {
      std::unique_ptr<Conn> conn = std::move(m_conns.front());
      m_conns.pop_front();
      ++m_n_accepted;
      err_code->clear();
      return conn;
    }
    // else
    if (m_end_err_code)
    {
      m_served_counter.wait_for(m_n_accepted);
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_end_err_code && (!m_closed))
    {
      *err_code = m_end_err_code;
      return nullptr;
    }
    m_cond.wait(lock, [&]() { return m_closed; });
    *err_code = boost::asio::error::operation_aborted;
    return nullptr;
  }

  void close() override
  {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_closed = true;
    }
    m_cond.notify_all();
  }

  /// Blocks until every connection handed out so far is done.
  void wait_all_served()
  {
    m_served_counter.wait_for(m_n_accepted);
  }

  /// Blocks until at least `n` connections are done.
  void wait_served(size_t n)
  {
    m_served_counter.wait_for(n);
  }

  /// If truthy, emitted by accept() after all connections are served.
  Error_code m_end_err_code;

private:
  std::deque<std::unique_ptr<Fake_conn>> m_conns;
  std::atomic<size_t> m_n_accepted{0};
  Served_counter m_served_counter;
  std::mutex m_mutex;
  std::condition_variable m_cond;
  bool m_closed = false;
}; // class Fake_listener

/// User database with a fixed set of users.
class Fake_user_directory : public User_directory
{
public:
  std::string username_of(const std::string& user_id, Error_code* err_code) const override
  {
    for (const auto& name_and_id : m_users)
    {
      if (name_and_id.second == user_id)
      {
        err_code->clear();
        return name_and_id.first;
      }
    }
    *err_code = error::Code::S_IDENTITY_USER_LOOKUP_FAILED;
    return std::string();
  }

  std::string user_id_of(const std::string& username, Error_code* err_code) const override
  {
    const auto it = m_users.find(username);
    if (it == m_users.end())
    {
      *err_code = error::Code::S_IDENTITY_USER_LOOKUP_FAILED;
      return std::string();
    }
    err_code->clear();
    return it->second;
  }

  /// Name to ID.
  std::map<std::string, std::string> m_users;
}; // class Fake_user_directory

/// Pipe queries answering from fixed tables.
class Fake_pipe_client_query : public Pipe_client_query
{
public:
  util::process_id_t client_process_id(util::pipe_handle_t handle, Error_code* err_code) const override
  {
    const auto it = m_pids.find(handle);
    if (it == m_pids.end())
    {
      *err_code = boost::asio::error::bad_descriptor;
      return 0;
    }
    err_code->clear();
    return it->second;
  }

  std::string process_owner_user_id(util::process_id_t process_id, Error_code* err_code) const override
  {
    const auto it = m_owners.find(process_id);
    if (it == m_owners.end())
    {
      *err_code = boost::asio::error::access_denied;
      return std::string();
    }
    err_code->clear();
    return it->second;
  }

  std::map<util::pipe_handle_t, util::process_id_t> m_pids;
  std::map<util::process_id_t, std::string> m_owners;
}; // class Fake_pipe_client_query

/// Api_handler recording the context of each request and answering with the permissions.
class Recording_api_handler : public Api_handler
{
public:
  void handle(const Api_context& ctx, const Request&, Response* rsp) override
  {
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_contexts.push_back(ctx);
    }
    if (!m_on_handle.empty())
    {
      m_on_handle();
    }
    std::ostringstream os;
    os << ctx.m_permissions;
    rsp->body() = os.str();
  }

  std::vector<Api_context> contexts() const
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_contexts;
  }

  /// If not empty, invoked during each handle().
  Function<void ()> m_on_handle;

private:
  mutable std::mutex m_mutex;
  std::vector<Api_context> m_contexts;
}; // class Recording_api_handler

// Free functions.

/**
 * Identity as a pipe resolver would produce it.
 * @param user_id
 *        User ID.
 * @param pid
 *        PID.
 * @return See above.
 */
inline Conn_identity::Ptr pipe_identity(const std::string& user_id, util::process_id_t pid)
{
  Conn_identity identity;
  identity.m_transport_kind = Transport_kind::S_PIPE;
  identity.m_user_id = user_id;
  identity.m_username = "user-" + user_id;
  identity.m_process_id = pid;
  return boost::make_shared<const Conn_identity>(std::move(identity));
}

/**
 * Identity as the credential resolver would produce it for a Unix-domain-socket peer.
 * @param uid
 *        UID.
 * @param pid
 *        PID.
 * @return See above.
 */
inline Conn_identity::Ptr socket_identity(util::user_id_t uid, util::process_id_t pid)
{
  Conn_identity identity;
  identity.m_transport_kind = Transport_kind::S_DOMAIN_SOCKET;
  identity.m_peer_creds.emplace(pid, uid, uid);
  identity.m_process_id = pid;
  return boost::make_shared<const Conn_identity>(std::move(identity));
}

} // namespace ctl::session::test
