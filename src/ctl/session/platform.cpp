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
#include "ctl/session/platform.hpp"

namespace ctl::session
{

// Implementations.

bool uses_pipe_identity(Platform platform)
{
  return platform == Platform::S_WINDOWS;
}

bool resets_on_idle(Platform platform)
{
  return platform == Platform::S_WINDOWS;
}

std::ostream& operator<<(std::ostream& os, Platform val)
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (val)
  {
  case Platform::S_WINDOWS:
    return os << "windows";
  case Platform::S_JS:
    return os << "js";
  case Platform::S_LINUX:
    return os << "linux";
  case Platform::S_DARWIN:
    return os << "darwin";
  case Platform::S_FREEBSD:
    return os << "freebsd";
  case Platform::S_OPENBSD:
    return os << "openbsd";
  case Platform::S_END_SENTINEL:
    return os << "END_SENTINEL";
  }
  assert(false);
  return os;
}

std::istream& operator>>(std::istream& is, Platform& val)
{
  // Range [S_WINDOWS, END_SENTINEL); no match => END_SENTINEL; allow number; case-insensitive.
  val = flow::util::istream_to_enum(&is, Platform::S_END_SENTINEL, Platform::S_END_SENTINEL, true, false,
                                    Platform::S_WINDOWS);
  return is;
}

} // namespace ctl::session
