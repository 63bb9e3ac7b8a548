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

#include "ctl/common.hpp"
#include <boost/noncopyable.hpp>
#include <map>

namespace ctl::session
{

// Types.

/**
 * A one-shot, thread-safe cancellation signal, as given to Control_server::run(): once cancel() is called,
 * every registered hook runs (once), and hooks registered later run immediately.
 *
 * Hooks run synchronously, under an internal lock, in the thread that calls cancel() (or on_cancel(), if already
 * canceled).  So they must be quick and non-blocking, and they must not call back into `*this`.
 */
class Cancellation :
  private boost::noncopyable
{
public:
  // Types.

  /// Handle of a registered hook, for remove_hook().
  using Hook_id = unsigned int;

  // Constructors/destructor.

  /// Constructs an un-canceled signal with no hooks.
  Cancellation();

  // Methods.

  /**
   * Fires the signal: runs all registered hooks.  Idempotent: subsequent calls do nothing.
   */
  void cancel();

  /**
   * Whether cancel() has been called.
   * @return See above.
   */
  bool canceled() const;

  /**
   * Registers a hook to run upon cancel(); if already canceled, runs it now instead.
   *
   * @param hook
   *        Hook.
   * @return ID for remove_hook().  (If the hook ran immediately, the ID is still valid but refers to nothing.)
   */
  Hook_id on_cancel(Function<void ()>&& hook);

  /**
   * Unregisters the given hook, if it has not yet run.  Upon return it is guaranteed not to be running and not to
   * run later.
   *
   * @param id
   *        Value from on_cancel().
   */
  void remove_hook(Hook_id id);

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Data.

  /// Protects all the data below.
  mutable Mutex m_mutex;

  /// Whether cancel() has been called.
  bool m_canceled;

  /// Next ID to issue from on_cancel().
  Hook_id m_next_id;

  /// Hooks not yet run, in order of registration.
  std::map<Hook_id, Function<void ()>> m_hooks;
}; // class Cancellation

} // namespace ctl::session
