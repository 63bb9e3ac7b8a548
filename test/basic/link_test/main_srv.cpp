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

#include <ctl/session/control_server.hpp>
#include <ctl/transport/local_stream_listener.hpp>
#include <flow/log/config.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <sstream>

namespace
{

/// Backend standing in for a real daemon's: it only logs what it is asked to do.
class Demo_backend :
  public ctl::session::Backend,
  public flow::log::Log_context
{
public:
  explicit Demo_backend(flow::log::Logger* logger_ptr) :
    flow::log::Log_context(logger_ptr, ctl::Log_component::S_UNCAT)
  {
  }

  ctl::Error_code check_connection_allowed(const ctl::session::Conn_identity&) override
  {
    return ctl::Error_code();
  }

  void set_current_user_id(const std::string& user_id) override
  {
    FLOW_LOG_INFO("Demo backend: Current user is now [" << user_id << "].");
  }

  void reset_for_client_disconnect() override
  {
    FLOW_LOG_INFO("Demo backend: Resetting per-user state.");
  }

  bool in_server_mode() override
  {
    return false;
  }

  bool prefs_valid() override
  {
    return true;
  }

  void start(const ctl::session::Start_options& opts) override
  {
    FLOW_LOG_INFO("Demo backend: Started; log ID [" << opts.m_backend_log_id << "].");
  }

  void shutdown() override
  {
    FLOW_LOG_INFO("Demo backend: Shut down.");
  }

  std::string operator_user_id() override
  {
    return std::string();
  }

  std::string status_html() override
  {
    return "<html><body><h1>Demo backend</h1>Running.</body></html>\n";
  }
}; // class Demo_backend

/// Local API with a single route reporting the caller's identity and permissions.
class Demo_api_handler : public ctl::session::Api_handler
{
public:
  void handle(const ctl::session::Api_context& ctx, const ctl::session::Request& req,
              ctl::session::Response* rsp) override
  {
    namespace http = boost::beast::http;

    if (req.target() != "/localapi/v0/whoami")
    {
      rsp->result(http::status::not_found);
      return;
    }
    // else
    std::ostringstream os;
    os << *ctx.m_identity << ' ' << ctx.m_permissions << '\n';
    rsp->set(http::field::content_type, "text/plain; charset=utf-8");
    rsp->body() = os.str();
  }
}; // class Demo_api_handler

} // namespace (anon)

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process; and, run by hand, it is a minimal daemon whose control server can be poked at with, e.g.,
 * `curl --unix-socket <path> http://localhost/localapi/v0/whoami`.  It serves until SIGINT/SIGTERM. */
int main(int argc, char const * const * argv)
{
  using flow::log::Simple_ostream_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Flow_log_component;
  using flow::async::Single_thread_task_loop;
  using boost::asio::signal_set;
  using std::exception;

  Config std_log_config(Sev::S_INFO);
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  std_log_config.init_component_to_union_idx_mapping<ctl::Log_component>
    (2000, size_t(ctl::Log_component::S_END_SENTINEL));
  std_log_config.init_component_names<ctl::Log_component>(ctl::S_CTL_LOG_COMPONENT_NAME_MAP, false, "ctl-");
  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  try
  {
    const ctl::fs::path socket_path((argc >= 2) ? argv[1] : "/tmp/ctl_link_test_srv.sock");

    ctl::session::Server_config config;
    config.m_backend_log_id = "link-test";
    ctl::session::load_server_config_from_env(&std_logger, &config);

    Demo_api_handler api_handler;
    ctl::session::Control_server server(&std_logger, config, &api_handler);
    ctl::transport::Local_stream_listener listener(&std_logger, socket_path, config.m_conn_idle_timeout);
    ctl::session::Cancellation cancellation;

    // Turn SIGINT/SIGTERM into cancellation.
    Single_thread_task_loop sig_loop(&std_logger, "ctl_srv_sig");
    sig_loop.start();
    signal_set sigs(*(sig_loop.task_engine()), SIGINT, SIGTERM);
    sigs.async_wait([&](const ctl::Error_code& err_code, int sig_num)
    {
      if (err_code != boost::asio::error::operation_aborted)
      {
        FLOW_LOG_INFO("Caught signal [" << sig_num << "]; stopping.");
        cancellation.cancel();
      }
    });

    server.bind_backend(std::make_unique<Demo_backend>(&std_logger));

    FLOW_LOG_INFO("Control server listening at [" << socket_path << "]; try: "
                  "curl --unix-socket " << socket_path.string() << " http://localhost/localapi/v0/whoami");
    server.run(&listener, &cancellation);

    sig_loop.stop();
    FLOW_LOG_INFO("Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return 1;
  }

  return 0;
} // main()
