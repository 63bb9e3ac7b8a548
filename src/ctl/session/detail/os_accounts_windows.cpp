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
#include <boost/scope_exit.hpp>
#include <windows.h>
#include <sddl.h>
#include <vector>

namespace ctl::session
{

namespace
{

// Types.

/// User_directory over the local security authority (SID strings as user IDs).
class Windows_user_directory : public User_directory
{
public:
  std::string username_of(const std::string& user_id, Error_code* err_code) const override;
  std::string user_id_of(const std::string& username, Error_code* err_code) const override;
};

/// Pipe_client_query over the named-pipe API and process tokens.
class Windows_pipe_client_query : public Pipe_client_query
{
public:
  util::process_id_t client_process_id(util::pipe_handle_t handle, Error_code* err_code) const override;
  std::string process_owner_user_id(util::process_id_t process_id, Error_code* err_code) const override;
};

// Free functions.

Error_code last_system_error()
{
  return Error_code(int(::GetLastError()), boost::system::system_category());
}

std::string sid_to_string(PSID sid, Error_code* err_code)
{
  LPSTR sid_str = nullptr;
  if (!::ConvertSidToStringSidA(sid, &sid_str))
  {
    *err_code = last_system_error();
    return std::string();
  }
  // else
  std::string result(sid_str);
  ::LocalFree(sid_str);
  err_code->clear();
  return result;
}

// Implementations.

std::string Windows_user_directory::username_of(const std::string& user_id, Error_code* err_code) const
{
  assert(err_code);

  PSID sid = nullptr;
  if (!::ConvertStringSidToSidA(user_id.c_str(), &sid))
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return std::string();
  }
  // else
  BOOST_SCOPE_EXIT_ALL(sid) { ::LocalFree(sid); };

  DWORD name_size = 0;
  DWORD domain_size = 0;
  SID_NAME_USE use;
  ::LookupAccountSidA(nullptr, sid, nullptr, &name_size, nullptr, &domain_size, &use);
  if ((name_size == 0) || (domain_size == 0))
  {
    *err_code = error::Code::S_IDENTITY_USER_LOOKUP_FAILED;
    return std::string();
  }
  // else

  std::vector<char> name(name_size);
  std::vector<char> domain(domain_size);
  if (!::LookupAccountSidA(nullptr, sid, name.data(), &name_size, domain.data(), &domain_size, &use))
  {
    *err_code = last_system_error();
    return std::string();
  }
  // else
  err_code->clear();
  return std::string(domain.data()) + '\\' + std::string(name.data());
} // Windows_user_directory::username_of()

std::string Windows_user_directory::user_id_of(const std::string& username, Error_code* err_code) const
{
  assert(err_code);

  DWORD sid_size = 0;
  DWORD domain_size = 0;
  SID_NAME_USE use;
  ::LookupAccountNameA(nullptr, username.c_str(), nullptr, &sid_size, nullptr, &domain_size, &use);
  if (sid_size == 0)
  {
    *err_code = error::Code::S_IDENTITY_USER_LOOKUP_FAILED;
    return std::string();
  }
  // else

  std::vector<BYTE> sid(sid_size);
  std::vector<char> domain(domain_size);
  if (!::LookupAccountNameA(nullptr, username.c_str(), sid.data(), &sid_size, domain.data(), &domain_size, &use))
  {
    *err_code = last_system_error();
    return std::string();
  }
  // else
  return sid_to_string(sid.data(), err_code);
}

util::process_id_t Windows_pipe_client_query::client_process_id(util::pipe_handle_t handle,
                                                                Error_code* err_code) const
{
  assert(err_code);

  ULONG pid = 0;
  if (!::GetNamedPipeClientProcessId(static_cast<HANDLE>(handle), &pid))
  {
    *err_code = last_system_error();
    return 0;
  }
  // else
  err_code->clear();
  return util::process_id_t(pid);
}

std::string Windows_pipe_client_query::process_owner_user_id(util::process_id_t process_id,
                                                             Error_code* err_code) const
{
  assert(err_code);

  const HANDLE process = ::OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, DWORD(process_id));
  if (!process)
  {
    *err_code = last_system_error();
    return std::string();
  }
  // else
  BOOST_SCOPE_EXIT_ALL(process) { ::CloseHandle(process); };

  HANDLE token = nullptr;
  if (!::OpenProcessToken(process, TOKEN_QUERY, &token))
  {
    *err_code = last_system_error();
    return std::string();
  }
  // else
  BOOST_SCOPE_EXIT_ALL(token) { ::CloseHandle(token); };

  DWORD info_size = 0;
  ::GetTokenInformation(token, TokenUser, nullptr, 0, &info_size);
  if (info_size == 0)
  {
    *err_code = last_system_error();
    return std::string();
  }
  // else

  std::vector<BYTE> info(info_size);
  if (!::GetTokenInformation(token, TokenUser, info.data(), info_size, &info_size))
  {
    *err_code = last_system_error();
    return std::string();
  }
  // else
  return sid_to_string(reinterpret_cast<const TOKEN_USER*>(info.data())->User.Sid, err_code);
} // Windows_pipe_client_query::process_owner_user_id()

} // namespace (anon)

// Implementations.

const User_directory& native_user_directory()
{
  static const Windows_user_directory s_user_dir;
  return s_user_dir;
}

const Pipe_client_query& native_pipe_client_query()
{
  static const Windows_pipe_client_query s_pipe_query;
  return s_pipe_query;
}

} // namespace ctl::session
