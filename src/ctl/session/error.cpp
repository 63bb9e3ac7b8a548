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
#include "ctl/session/error.hpp"

namespace ctl::session::error
{

// Types.

/**
 * The boost.system category for errors returned by the ctl::session module.  There is exactly one instance,
 * Category::S_CATEGORY; `Error_code`s built from Code point to it.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's conceptual name: "ctl/session".
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns a string describing the given error code, which must be a Code value cast to `int`.
   *
   * @param val
   *        A Code value, cast to `int`.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns a brief string representing the given code, suitable for `operator<<(Code)` and reversible
   * via `operator>>(Code)`.
   *
   * @param code
   *        See above.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for ctl::session::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

bool is_identity_resolution_error(const Error_code& err_code)
{
  return (err_code.category() == Category::S_CATEGORY)
         && ((err_code == Code::S_IDENTITY_NOT_PIPE_BACKED)
             || (err_code == Code::S_IDENTITY_CLIENT_PID_QUERY_FAILED)
             || (err_code == Code::S_IDENTITY_PROCESS_OWNER_UNKNOWN)
             || (err_code == Code::S_IDENTITY_USER_LOOKUP_FAILED));
}

bool is_access_denied(const Error_code& err_code)
{
  return (err_code == Code::S_ACCESS_DENIED_OTHER_USER_ACTIVE) || (err_code == Code::S_ACCESS_DENIED_BY_POLICY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "ctl/session";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments against the API spec.";
  case Code::S_IDENTITY_NOT_PIPE_BACKED:
    return "Identity resolution: the connection is not backed by a named pipe, so its client process cannot be "
           "queried.";
  case Code::S_IDENTITY_CLIENT_PID_QUERY_FAILED:
    return "Identity resolution: the OS could not report the client process ID bound to the connection's "
           "named pipe.";
  case Code::S_IDENTITY_PROCESS_OWNER_UNKNOWN:
    return "Identity resolution: the client process ID could not be mapped to its owning user; this is typical of "
           "a process living in another namespace or subsystem (such as WSL).";
  case Code::S_IDENTITY_USER_LOOKUP_FAILED:
    return "Identity resolution: the owning user ID of the client process could not be looked up in the user "
           "database.";
  case Code::S_ACCESS_DENIED_OTHER_USER_ACTIVE:
    return "Access denied: requests from a different local user are currently active; wait for that session "
           "to end.";
  case Code::S_ACCESS_DENIED_BY_POLICY:
    return "Access denied: the backend's connection policy rejected the identity of the connecting process.";
  case Code::S_NO_BACKEND:
    return "A request arrived before a backend was bound to the server.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_IDENTITY_NOT_PIPE_BACKED:
    return "IDENTITY_NOT_PIPE_BACKED";
  case Code::S_IDENTITY_CLIENT_PID_QUERY_FAILED:
    return "IDENTITY_CLIENT_PID_QUERY_FAILED";
  case Code::S_IDENTITY_PROCESS_OWNER_UNKNOWN:
    return "IDENTITY_PROCESS_OWNER_UNKNOWN";
  case Code::S_IDENTITY_USER_LOOKUP_FAILED:
    return "IDENTITY_USER_LOOKUP_FAILED";
  case Code::S_ACCESS_DENIED_OTHER_USER_ACTIVE:
    return "ACCESS_DENIED_OTHER_USER_ACTIVE";
  case Code::S_ACCESS_DENIED_BY_POLICY:
    return "ACCESS_DENIED_BY_POLICY";
  case Code::S_NO_BACKEND:
    return "NO_BACKEND";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace ctl::session::error
