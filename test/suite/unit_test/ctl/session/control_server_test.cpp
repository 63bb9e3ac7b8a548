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
#include "ctl/session/error.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>
#include <future>
#include <thread>

namespace ctl::session::test
{

namespace
{

namespace http = boost::beast::http;

Server_config test_config(Platform platform)
{
  Server_config config;
  config.set_platform(platform);
  config.m_backend_log_id = "log-id-1";
  return config;
}

Request get_request(util::String_view target, util::String_view host = "localhost:41112")
{
  Request req(http::verb::get, std::string(target), 11);
  req.set(http::field::host, std::string(host));
  return req;
}

/// Handles `req` as arriving on a connection with `identity`.
Response handle(Control_server* server, const Request& req, const Conn_identity::Ptr& identity,
                const Error_code& identity_err_code = Error_code())
{
  Response rsp;
  server->handle_request(req, identity, identity_err_code, &rsp);
  return rsp;
}

} // namespace (anon)

TEST(Control_server_test, Bind_misuse_is_fatal)
{
  Test_logger logger;

  EXPECT_DEATH({
    Control_server server(&logger, test_config(Platform::S_LINUX));
    server.bind_backend(nullptr);
  }, "");

  EXPECT_DEATH({
    Control_server server(&logger, test_config(Platform::S_LINUX));
    server.bind_backend(std::make_unique<Fake_backend>());
    server.bind_backend(std::make_unique<Fake_backend>());
  }, "");

  EXPECT_DEATH({
    const Control_server server(&logger, test_config(Platform::S_LINUX));
    server.must_backend();
  }, "");
}

TEST(Control_server_test, Bind_then_run_starts_once)
{
  Test_logger logger;
  Control_server server(&logger, test_config(Platform::S_LINUX));
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  server.bind_backend(std::move(backend_owner));
  EXPECT_EQ(server.backend(), &backend);
  EXPECT_EQ(&server.must_backend(), &backend);
  EXPECT_EQ(backend.m_n_starts, 0); // Not running yet.

  Fake_listener listener;
  Cancellation cancellation;
  cancellation.cancel();
  Error_code err_code;
  server.run(&listener, &cancellation, &err_code);
  EXPECT_FALSE(err_code) << err_code.message();

  EXPECT_EQ(backend.m_n_starts, 1);
  EXPECT_EQ(backend.m_start_log_id, "log-id-1");
  EXPECT_EQ(backend.m_n_shutdowns, 1);
}

TEST(Control_server_test, Run_then_bind_starts_once)
{
  Test_logger logger;
  Control_server server(&logger, test_config(Platform::S_LINUX));
  EXPECT_EQ(server.backend(), nullptr);

  Fake_listener listener;
  Cancellation cancellation;
  Error_code err_code;
  std::thread runner([&]() { server.run(&listener, &cancellation, &err_code); });

  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  // run() may or may not have marked itself running yet; either way the backend ends up started exactly once.
  server.bind_backend(std::move(backend_owner));

  cancellation.cancel();
  runner.join();
  EXPECT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(backend.m_n_starts, 1);
  EXPECT_EQ(backend.m_n_shutdowns, 1);
}

TEST(Control_server_test, Invalid_prefs_not_started)
{
  Test_logger logger;
  Control_server server(&logger, test_config(Platform::S_LINUX));
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  backend.m_prefs_valid = false;
  server.bind_backend(std::move(backend_owner));

  Fake_listener listener;
  Cancellation cancellation;
  cancellation.cancel();
  server.run(&listener, &cancellation);

  EXPECT_EQ(backend.m_n_starts, 0);
  EXPECT_EQ(backend.m_n_shutdowns, 1);
}

TEST(Control_server_test, Routing)
{
  Test_logger logger;
  Recording_api_handler api_handler;
  Control_server server(&logger, test_config(Platform::S_LINUX), &api_handler);
  const auto identity = socket_identity(1000, 55);

  Request connect_req(http::verb::connect, "localhost:443", 11);
  EXPECT_EQ(handle(&server, connect_req, identity).result(), http::status::method_not_allowed);

  auto rsp = handle(&server, get_request("/"), identity);
  EXPECT_EQ(rsp.result(), http::status::service_unavailable);
  EXPECT_EQ(rsp.body(), "no backend\n");

  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  backend.m_operator_user_id = "1000";
  server.bind_backend(std::move(backend_owner));

  EXPECT_EQ(handle(&server, connect_req, identity).result(), http::status::method_not_allowed);

  const Error_code identity_err_code = error::Code::S_IDENTITY_PROCESS_OWNER_UNKNOWN;
  rsp = handle(&server, get_request("/"), Conn_identity::Ptr(), identity_err_code);
  EXPECT_EQ(rsp.result(), http::status::unauthorized);
  EXPECT_EQ(rsp.body(), identity_err_code.message() + '\n');

  rsp = handle(&server, get_request("/"), identity);
  EXPECT_EQ(rsp.result(), http::status::ok);
  EXPECT_EQ(rsp.body(), Control_server::S_ROOT_PAGE_HTML);
  EXPECT_EQ(rsp[http::field::content_type], "text/html; charset=utf-8");

  EXPECT_EQ(handle(&server, get_request("/favicon.ico"), identity).result(), http::status::not_found);

  // The operator, on a domain socket, may read but not write.
  rsp = handle(&server, get_request("/localapi/v0/status"), identity);
  EXPECT_EQ(rsp.result(), http::status::ok);
  const auto contexts = api_handler.contexts();
  ASSERT_EQ(contexts.size(), 1u);
  EXPECT_EQ(contexts[0].m_backend, &backend);
  EXPECT_EQ(contexts[0].m_backend_log_id, "log-id-1");
  EXPECT_EQ(contexts[0].m_identity, identity);
  EXPECT_TRUE(contexts[0].m_permissions.m_read);
  EXPECT_FALSE(contexts[0].m_permissions.m_write);
  EXPECT_FALSE(contexts[0].m_permissions.m_cert);

  // Every request was deregistered.
  EXPECT_EQ(server.session_tracker().n_active_requests(), 0u);
}

TEST(Control_server_test, No_api_handler)
{
  Test_logger logger;
  Control_server server(&logger, test_config(Platform::S_LINUX));
  server.bind_backend(std::make_unique<Fake_backend>());
  EXPECT_EQ(handle(&server, get_request("/localapi/v0/status"), socket_identity(1000, 1)).result(),
            http::status::not_found);
}

TEST(Control_server_test, Status_page)
{
  Test_logger logger;
  Control_server server(&logger, test_config(Platform::S_WINDOWS));
  EXPECT_TRUE(server.config().m_serve_status_page);
  auto backend_owner = std::make_unique<Fake_backend>();
  backend_owner->m_server_mode = true;
  server.bind_backend(std::move(backend_owner));
  const auto identity = pipe_identity("S-1-5-21-1", 10);

  for (const auto host : { "localhost:41112", "127.0.0.1:41112", "[::1]:41112" })
  {
    const auto rsp = handle(&server, get_request("/", host), identity);
    EXPECT_EQ(rsp.result(), http::status::ok) << host;
    EXPECT_EQ(rsp.body(), "<p>status</p>");
    EXPECT_EQ(rsp["Content-Security-Policy"], Control_server::S_STATUS_PAGE_CSP);
    EXPECT_EQ(rsp["X-Frame-Options"], "DENY");
    EXPECT_EQ(rsp["X-Content-Type-Options"], "nosniff");
    EXPECT_EQ(rsp[http::field::content_type], "text/html; charset=utf-8");
  }

  // The last one: a non-ASCII (IDN) name.
  for (const auto host : { "evil.example:41112", "localhost", "ctl.local", "\xd0\xbf\xd1\x80:41112" })
  {
    const auto rsp = handle(&server, get_request("/", host), identity);
    EXPECT_EQ(rsp.result(), http::status::forbidden) << host;
    EXPECT_EQ(rsp.body(), "invalid host\n");
  }
}

TEST(Control_server_test, Same_user_sequential_connections)
{
  Test_logger logger;
  Recording_api_handler api_handler;
  Control_server server(&logger, test_config(Platform::S_WINDOWS), &api_handler);
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  backend.m_server_mode = true;
  server.bind_backend(std::move(backend_owner));

  // Two connections (distinct processes) of one user, one after the other.
  EXPECT_EQ(handle(&server, get_request("/localapi/v0/status"), pipe_identity("S-1-5-21-1", 10)).result(),
            http::status::ok);
  EXPECT_EQ(handle(&server, get_request("/localapi/v0/status"), pipe_identity("S-1-5-21-1", 11)).result(),
            http::status::ok);

  EXPECT_EQ(backend.m_n_resets, 0);
  const auto contexts = api_handler.contexts();
  ASSERT_EQ(contexts.size(), 2u);
  EXPECT_TRUE(contexts[1].m_permissions.m_read);
  EXPECT_TRUE(contexts[1].m_permissions.m_write);
  EXPECT_FALSE(contexts[1].m_permissions.m_cert);
}

TEST(Control_server_test, Other_user_refused_while_active)
{
  Test_logger logger;
  Recording_api_handler api_handler;
  Control_server server(&logger, test_config(Platform::S_WINDOWS), &api_handler);
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  backend.m_server_mode = true; // So that completing a request by itself never resets.
  server.bind_backend(std::move(backend_owner));

  const auto user_a = pipe_identity("S-1-5-21-1", 10);
  const auto user_b = pipe_identity("S-1-5-21-2", 20);

  // A's first request completes, establishing A as the last user.
  EXPECT_EQ(handle(&server, get_request("/localapi/v0/status"), user_a).result(), http::status::ok);

  // A's second request stays in flight until released.
  std::atomic<bool> block_next(true);
  std::promise<void> entered;
  std::promise<void> release;
  auto release_future = release.get_future();
  api_handler.m_on_handle = [&]()
  {
    if (block_next.exchange(false))
    {
      entered.set_value();
      release_future.wait();
    }
  };
  std::thread a_thread([&]()
  {
    EXPECT_EQ(handle(&server, get_request("/localapi/v0/status"), user_a).result(), http::status::ok);
  });
  entered.get_future().wait();

  const auto rsp = handle(&server, get_request("/localapi/v0/status"), user_b);
  EXPECT_EQ(rsp.result(), http::status::unauthorized);
  EXPECT_NE(rsp.body().find("already in use by user-S-1-5-21-1, pid 10"), std::string::npos) << rsp.body();

  release.set_value();
  a_thread.join();
  EXPECT_EQ(backend.m_n_resets, 0);

  // Now B becomes the active user: that is when the reset happens.
  EXPECT_EQ(handle(&server, get_request("/localapi/v0/status"), user_b).result(), http::status::ok);
  EXPECT_EQ(backend.m_n_resets, 1);
}

TEST(Control_server_test, Pipe_permissions_follow_current_policy)
{
  Test_logger logger;
  Control_server server(&logger, test_config(Platform::S_WINDOWS));
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  server.bind_backend(std::move(backend_owner));
  const auto user_a = pipe_identity("S-1-5-21-1", 10);

  auto perms = server.local_api_permissions(*user_a);
  EXPECT_TRUE(perms.m_read);
  EXPECT_TRUE(perms.m_write);

  // The policy turns against A (say, mid-request): no longer authorized.
  backend.m_policy_err_code = boost::asio::error::access_denied;
  perms = server.local_api_permissions(*user_a);
  EXPECT_FALSE(perms.m_read);
  EXPECT_FALSE(perms.m_write);
  EXPECT_FALSE(perms.m_cert);
}

TEST(Control_server_test, Idle_reset_unless_server_mode)
{
  Test_logger logger;
  Control_server server(&logger, test_config(Platform::S_WINDOWS));
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  server.bind_backend(std::move(backend_owner));

  const auto user_a = pipe_identity("S-1-5-21-1", 10);
  handle(&server, get_request("/"), user_a);
  EXPECT_EQ(backend.m_n_resets, 1);

  backend.m_server_mode = true;
  handle(&server, get_request("/"), user_a);
  EXPECT_EQ(backend.m_n_resets, 1);
}

TEST(Control_server_test, Run_serves_connections)
{
  Test_logger logger;
  Recording_api_handler api_handler;
  Control_server server(&logger, test_config(Platform::S_LINUX), &api_handler);
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  server.bind_backend(std::move(backend_owner));

  Fake_listener listener;
  std::vector<boost::shared_ptr<Conn_record>> records;
  for (util::user_id_t uid = 1000; uid != 1003; ++uid)
  {
    auto conn = std::make_unique<Fake_conn>();
    conn->m_peer_creds.emplace(uid, uid, uid);
    conn->add_get("/");
    conn->add_get("/localapi/v0/status");
    conn->add_get("/nope", false);
    conn->add_get("/never-read"); // The previous one was not keep-alive.
    records.push_back(conn->m_record);
    listener.add_conn(std::move(conn));
  }

  Cancellation cancellation;
  Error_code err_code;
  std::thread runner([&]() { server.run(&listener, &cancellation, &err_code); });
  listener.wait_all_served();
  cancellation.cancel();
  runner.join();

  EXPECT_FALSE(err_code) << err_code.message();
  for (const auto& record : records)
  {
    std::lock_guard<std::mutex> lock(record->m_mutex);
    ASSERT_EQ(record->m_responses.size(), 3u);
    EXPECT_EQ(record->m_responses[0].result(), http::status::ok);
    EXPECT_EQ(record->m_responses[0].body(), Control_server::S_ROOT_PAGE_HTML);
    EXPECT_EQ(record->m_responses[1].result(), http::status::ok);
    EXPECT_EQ(record->m_responses[2].result(), http::status::not_found);
    EXPECT_FALSE(record->m_responses[2].keep_alive());
  }
  EXPECT_EQ(api_handler.contexts().size(), 3u);
  EXPECT_EQ(backend.m_n_starts, 1);
  EXPECT_EQ(backend.m_n_shutdowns, 1);
  EXPECT_EQ(server.session_tracker().n_active_requests(), 0u);
}

TEST(Control_server_test, Run_reports_listener_failure)
{
  Test_logger logger;

  {
    Control_server server(&logger, test_config(Platform::S_LINUX));
    auto backend_owner = std::make_unique<Fake_backend>();
    auto& backend = *backend_owner;
    server.bind_backend(std::move(backend_owner));

    Fake_listener listener;
    listener.m_end_err_code = boost::asio::error::connection_aborted;
    Cancellation cancellation;
    Error_code err_code;
    server.run(&listener, &cancellation, &err_code);
    EXPECT_EQ(err_code, boost::asio::error::connection_aborted);
    EXPECT_EQ(backend.m_n_shutdowns, 1);
  }

  {
    Control_server server(&logger, test_config(Platform::S_LINUX));
    Fake_listener listener;
    listener.m_end_err_code = boost::asio::error::connection_aborted;
    Cancellation cancellation;
    EXPECT_THROW(server.run(&listener, &cancellation), flow::error::Runtime_error);
  }
}

namespace
{

/// Pipe-backed Fake_conn whose client process `pid` belongs to `user_id`, as known to `*pipe_query`.
std::unique_ptr<Fake_conn> pipe_conn(Fake_pipe_client_query* pipe_query, util::process_id_t pid,
                                     const std::string& user_id)
{
  auto conn = std::make_unique<Fake_conn>(Transport_kind::S_PIPE);
  const auto handle = reinterpret_cast<util::pipe_handle_t>(uintptr_t(pid));
  conn->m_pipe_handle = handle;
  pipe_query->m_pids[handle] = pid;
  pipe_query->m_owners[pid] = user_id;
  return conn;
}

} // namespace (anon)

TEST(Control_server_test, Run_serves_connections_independently)
{
  Test_logger logger;
  Fake_pipe_client_query pipe_query;
  Fake_user_directory user_dir;
  user_dir.m_users = { { "alice", "S-1-5-21-1" }, { "bob", "S-1-5-21-2" } };

  Recording_api_handler api_handler;
  Control_server server(&logger, test_config(Platform::S_WINDOWS), &api_handler,
                        std::make_unique<Pipe_identity_resolver>(&logger, pipe_query, user_dir));
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  backend.m_server_mode = true;
  server.bind_backend(std::move(backend_owner));

  // Alice's request stays in the API handler until released.
  std::atomic<bool> block_next(true);
  std::promise<void> entered;
  std::promise<void> release;
  auto release_future = release.get_future().share();
  api_handler.m_on_handle = [&]()
  {
    if (block_next.exchange(false))
    {
      entered.set_value();
      release_future.wait();
    }
  };

  Fake_listener listener;
  auto alice_conn = pipe_conn(&pipe_query, 10, "S-1-5-21-1");
  alice_conn->add_get("/localapi/v0/status");
  const auto alice_record = alice_conn->m_record;
  listener.add_conn(std::move(alice_conn));

  // More of Bob's connections than there are cores: none may wait behind Alice's (or each other's).
  const size_t n_bob_conns = std::thread::hardware_concurrency() + 2;
  std::vector<boost::shared_ptr<Conn_record>> bob_records;
  for (size_t idx = 0; idx != n_bob_conns; ++idx)
  {
    auto bob_conn = pipe_conn(&pipe_query, util::process_id_t(100 + idx), "S-1-5-21-2");
    bob_conn->add_get("/localapi/v0/status");
    bob_records.push_back(bob_conn->m_record);
    listener.add_conn(std::move(bob_conn));
  }

  Cancellation cancellation;
  Error_code err_code;
  std::thread runner([&]() { server.run(&listener, &cancellation, &err_code); });

  entered.get_future().wait();
  listener.wait_served(n_bob_conns); // With Alice's still in flight.
  for (const auto& record : bob_records)
  {
    std::lock_guard<std::mutex> lock(record->m_mutex);
    ASSERT_EQ(record->m_responses.size(), 1u);
    EXPECT_EQ(record->m_responses[0].result(), http::status::unauthorized);
    EXPECT_NE(record->m_responses[0].body().find("already in use by alice, pid 10"), std::string::npos)
      << record->m_responses[0].body();
  }
  EXPECT_EQ(backend.m_n_resets, 0);

  release.set_value();
  listener.wait_all_served();
  cancellation.cancel();
  runner.join();

  EXPECT_FALSE(err_code) << err_code.message();
  {
    std::lock_guard<std::mutex> lock(alice_record->m_mutex);
    ASSERT_EQ(alice_record->m_responses.size(), 1u);
    EXPECT_EQ(alice_record->m_responses[0].result(), http::status::ok);
  }
  EXPECT_EQ(backend.m_n_resets, 0);
  EXPECT_EQ(backend.m_n_shutdowns, 1);
}

TEST(Control_server_test, Cancel_closes_idle_connections)
{
  Test_logger logger;
  Control_server server(&logger, test_config(Platform::S_LINUX));
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  server.bind_backend(std::move(backend_owner));

  // A keep-alive client: one request, then silence.
  Fake_listener listener;
  auto conn = std::make_unique<Fake_conn>();
  conn->m_peer_creds.emplace(1000, 1000, 1000);
  conn->add_get("/");
  conn->m_hold_open = true;
  const auto record = conn->m_record;
  listener.add_conn(std::move(conn));

  Cancellation cancellation;
  Error_code err_code;
  std::promise<void> run_done;
  auto run_done_future = run_done.get_future();
  std::thread runner([&]()
  {
    server.run(&listener, &cancellation, &err_code);
    run_done.set_value();
  });

  record->wait_for_responses(1);
  cancellation.cancel();
  // Without cancellation of reads this would wait for the client forever.
  EXPECT_EQ(run_done_future.wait_for(std::chrono::seconds(10)), std::future_status::ready);
  runner.join();

  EXPECT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(backend.m_n_shutdowns, 1);
  listener.wait_all_served();
  std::lock_guard<std::mutex> lock(record->m_mutex);
  EXPECT_TRUE(record->m_canceled);
  EXPECT_EQ(record->m_responses.size(), 1u);
}

TEST(Control_server_test, Cancel_shuts_backend_down_before_requests_in_flight_finish)
{
  Test_logger logger;
  Recording_api_handler api_handler;
  Control_server server(&logger, test_config(Platform::S_LINUX), &api_handler);
  auto backend_owner = std::make_unique<Fake_backend>();
  auto& backend = *backend_owner;
  std::promise<void> shut_down;
  backend.m_on_shutdown = [&]() { shut_down.set_value(); };
  server.bind_backend(std::move(backend_owner));

  std::promise<void> entered;
  std::promise<void> release;
  auto release_future = release.get_future().share();
  api_handler.m_on_handle = [&]()
  {
    entered.set_value();
    release_future.wait();
  };

  Fake_listener listener;
  auto conn = std::make_unique<Fake_conn>();
  conn->m_peer_creds.emplace(1000, 1000, 1000);
  conn->add_get("/localapi/v0/watch");
  conn->m_hold_open = true;
  const auto record = conn->m_record;
  listener.add_conn(std::move(conn));

  Cancellation cancellation;
  Error_code err_code;
  std::thread runner([&]() { server.run(&listener, &cancellation, &err_code); });

  entered.get_future().wait();
  cancellation.cancel();
  EXPECT_EQ(shut_down.get_future().wait_for(std::chrono::seconds(10)), std::future_status::ready);
  EXPECT_EQ(backend.m_n_shutdowns, 1);

  // The request in flight still gets its answer; then its connection closes.
  release.set_value();
  runner.join();
  EXPECT_FALSE(err_code) << err_code.message();
  EXPECT_EQ(backend.m_n_shutdowns, 1);
  std::lock_guard<std::mutex> lock(record->m_mutex);
  ASSERT_EQ(record->m_responses.size(), 1u);
  EXPECT_EQ(record->m_responses[0].result(), http::status::ok);
  EXPECT_TRUE(record->m_canceled);
}

} // namespace ctl::session::test
