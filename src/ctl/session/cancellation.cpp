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
#include "ctl/session/cancellation.hpp"

namespace ctl::session
{

// Implementations.

Cancellation::Cancellation() :
  m_canceled(false),
  m_next_id(0)
{
  // Nothing else.
}

void Cancellation::cancel()
{
  Lock_guard lock(m_mutex);
  if (m_canceled)
  {
    return;
  }
  // else
  m_canceled = true;

  for (auto& id_and_hook : m_hooks)
  {
    id_and_hook.second();
  }
  m_hooks.clear();
}

bool Cancellation::canceled() const
{
  Lock_guard lock(m_mutex);
  return m_canceled;
}

Cancellation::Hook_id Cancellation::on_cancel(Function<void ()>&& hook)
{
  Lock_guard lock(m_mutex);
  const auto id = m_next_id++;
  if (m_canceled)
  {
    hook();
  }
  else
  {
    m_hooks.emplace(id, std::move(hook));
  }
  return id;
}

void Cancellation::remove_hook(Hook_id id)
{
  Lock_guard lock(m_mutex);
  m_hooks.erase(id);
}

} // namespace ctl::session
