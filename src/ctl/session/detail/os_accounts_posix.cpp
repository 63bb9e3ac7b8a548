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
#include "ctl/session/os_accounts.hpp"
#include "ctl/session/error.hpp"
#include <boost/asio/error.hpp>
#include <boost/lexical_cast.hpp>
#include <cassert>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace ctl::session
{

namespace
{

// Types.

/// User_directory over the POSIX password database.
class Posix_user_directory : public User_directory
{
public:
  std::string username_of(const std::string& user_id, Error_code* err_code) const override;
  std::string user_id_of(const std::string& username, Error_code* err_code) const override;

private:
  /**
   * Runs `getpw*_r()`-style `lookup_func(pwd, buf, buf_size, &result)`, growing the buffer on `ERANGE`.
   *
   * @return The `passwd` on success (pointing into `*buf`); null on failure (`*err_code` set).
   */
  template<typename Lookup_func>
  static const ::passwd* run_lookup(const Lookup_func& lookup_func, ::passwd* pwd, std::vector<char>* buf,
                                    Error_code* err_code);
}; // class Posix_user_directory

/// Pipe_client_query for a platform without named pipes; process ownership comes from the `/proc` entry owner.
class Posix_pipe_client_query : public Pipe_client_query
{
public:
  util::process_id_t client_process_id(util::pipe_handle_t handle, Error_code* err_code) const override;
  std::string process_owner_user_id(util::process_id_t process_id, Error_code* err_code) const override;
};

// Implementations.

template<typename Lookup_func>
const ::passwd* Posix_user_directory::run_lookup(const Lookup_func& lookup_func, ::passwd* pwd,
                                                 std::vector<char>* buf, Error_code* err_code) // Static.
{
  using boost::system::system_category;

  const auto size_hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
  buf->resize((size_hint > 0) ? size_t(size_hint) : size_t(1024));

  ::passwd* result = nullptr;
  int rc;
  while ((rc = lookup_func(pwd, buf->data(), buf->size(), &result)) == ERANGE)
  {
    buf->resize(buf->size() * 2);
  }

  if (rc != 0)
  {
    *err_code = Error_code(rc, system_category());
    return nullptr;
  }
  // else
  if (!result)
  {
    *err_code = error::Code::S_IDENTITY_USER_LOOKUP_FAILED;
    return nullptr;
  }
  // else
  err_code->clear();
  return result;
} // Posix_user_directory::run_lookup()

std::string Posix_user_directory::username_of(const std::string& user_id, Error_code* err_code) const
{
  using boost::conversion::try_lexical_convert;

  assert(err_code);

  util::user_id_t uid;
  if (!try_lexical_convert(user_id, uid))
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return std::string();
  }
  // else

  ::passwd pwd;
  std::vector<char> buf;
  const auto result = run_lookup([uid](::passwd* pwd_ptr, char* buf_ptr, size_t buf_size, ::passwd** result_ptr)
  {
    return ::getpwuid_r(uid, pwd_ptr, buf_ptr, buf_size, result_ptr);
  }, &pwd, &buf, err_code);

  return result ? std::string(result->pw_name) : std::string();
}

std::string Posix_user_directory::user_id_of(const std::string& username, Error_code* err_code) const
{
  using std::to_string;

  assert(err_code);

  ::passwd pwd;
  std::vector<char> buf;
  const auto result = run_lookup([&username](::passwd* pwd_ptr, char* buf_ptr, size_t buf_size,
                                             ::passwd** result_ptr)
  {
    return ::getpwnam_r(username.c_str(), pwd_ptr, buf_ptr, buf_size, result_ptr);
  }, &pwd, &buf, err_code);

  return result ? to_string(result->pw_uid) : std::string();
}

util::process_id_t Posix_pipe_client_query::client_process_id(util::pipe_handle_t, Error_code* err_code) const
{
  assert(err_code);
  *err_code = boost::asio::error::operation_not_supported;
  return 0;
}

std::string Posix_pipe_client_query::process_owner_user_id(util::process_id_t process_id,
                                                           Error_code* err_code) const
{
  using boost::system::system_category;
  using std::to_string;

  assert(err_code);

  // The /proc/<pid> directory is owned by the process's effective UID.
  struct ::stat stats;
  const auto proc_path = "/proc/" + to_string(process_id);
  if (::stat(proc_path.c_str(), &stats) == -1)
  {
    *err_code = Error_code(errno, system_category());
    return std::string();
  }
  // else
  err_code->clear();
  return to_string(stats.st_uid);
}

} // namespace (anon)

// Implementations.

const User_directory& native_user_directory()
{
  static const Posix_user_directory s_user_dir;
  return s_user_dir;
}

const Pipe_client_query& native_pipe_client_query()
{
  static const Posix_pipe_client_query s_pipe_query;
  return s_pipe_query;
}

} // namespace ctl::session
