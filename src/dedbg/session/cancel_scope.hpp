/* dedbg: Debug client sessions
 * Copyright 2026 The dedbg Authors
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

#include "dedbg/common.hpp"
#include <flow/util/util.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/core/noncopyable.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <cstdint>
#include <map>
#include <vector>

namespace dedbg::session
{

// Types.

class Cancel_scope;

/// Short-hand for ref-counted pointer to Cancel_scope; the only way to hold one.
using Cancel_scope_ptr = boost::shared_ptr<Cancel_scope>;

/**
 * A one-way cancellation signal in a hierarchy: cancel() fires it; after that canceled() is `true` forever, and
 * each callback registered via on_cancel() has been invoked exactly once.  A scope made by create_child() or
 * create_linked() is canceled automatically when any of its parents is; the converse does not hold.
 *
 * In dedbg a session owns a session-wide scope; each connection gets a child of that; and each request waits on
 * a child of the connection's scope (possibly also linked to a caller-supplied scope, or with a timeout attached
 * via cancel_after()).
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently with each other.  Callbacks are invoked without any internal lock
 * held, in the thread that triggered cancellation (or, for on_cancel() on an already-canceled scope, the calling
 * thread, synchronously).
 *
 * ### Lifetime ###
 * A parent does not keep its children alive; a child does not keep its parents alive.  A child's link to its
 * parents is dropped when the child is destroyed.
 */
class Cancel_scope :
  public boost::enable_shared_from_this<Cancel_scope>,
  private boost::noncopyable
{
public:
  // Types.

  /**
   * RAII handle returned by on_cancel(): destroying it (or calling release()) deregisters the callback if it has not
   * yet been invoked.  Movable, not copyable.
   */
  class Registration
  {
  public:
    // Constructors/destructor.

    /// Constructs a handle that refers to no callback.
    Registration();

    /**
     * Move-constructs.
     *
     * @param src
     *        Becomes as-if default-constructed.
     */
    Registration(Registration&& src);

    /// Deregisters, as if by release().
    ~Registration();

    // Methods.

    /**
     * Move-assigns, first deregistering whatever `*this` referred to.
     *
     * @param src
     *        Becomes as-if default-constructed.
     * @return `*this`.
     */
    Registration& operator=(Registration&& src);

    /// Deregisters the callback if still registered.  `*this` then refers to no callback.  Idempotent.
    void release();

  private:
    // Friends.

    // Friend of Registration: For access to our private ctor.
    friend class Cancel_scope;

    // Constructors.

    /**
     * Constructs a handle to the given callback.
     *
     * @param scope
     *        Where registered.
     * @param id
     *        ID of the callback within `scope`.
     */
    explicit Registration(const Cancel_scope_ptr& scope, uint64_t id);

    // Data.

    /// Where the callback is registered; null if nowhere.
    boost::weak_ptr<Cancel_scope> m_scope;

    /// Callback ID within `m_scope`.
    uint64_t m_id;
  }; // class Registration

  // Constructors/destructor.

  /**
   * Creates a root scope: canceled only by an explicit cancel() (or cancel_after()).
   * @return See above.
   */
  static Cancel_scope_ptr create();

  /**
   * Creates a scope that is canceled when `parent` is (immediately, if it already is).
   *
   * @param parent
   *        Parent.  Must not be null.
   * @return See above.
   */
  static Cancel_scope_ptr create_child(const Cancel_scope_ptr& parent);

  /**
   * Creates a scope that is canceled when either `parent1` or `parent2` is.
   *
   * @param parent1
   *        Parent.  Must not be null.
   * @param parent2
   *        Parent.  Must not be null.
   * @return See above.
   */
  static Cancel_scope_ptr create_linked(const Cancel_scope_ptr& parent1, const Cancel_scope_ptr& parent2);

  // Methods.

  /// Fires the signal: invokes all registered callbacks and cancels all child scopes.  No-op if already canceled.
  void cancel();

  /**
   * Whether cancel() has been invoked (directly or via a parent, or a timeout).
   * @return See above.
   */
  bool canceled() const;

  /**
   * Registers a callback to invoke upon cancellation.  If already canceled, invokes it synchronously instead and
   * returns a handle to nothing.
   *
   * @param on_cancel_func
   *        Callback.  Must not block; must not destroy `*this`.
   * @return Handle whose destruction deregisters the callback.
   */
  Registration on_cancel(Function<void ()>&& on_cancel_func);

  /**
   * Arranges for cancel() to be invoked after the given time elapses, unless `*this` is destroyed first.  The wait
   * executes on `task_engine`, which must outlive `*this`.  At most one such timer may be set per scope, and only
   * before `*this` is shared with other threads.
   *
   * @param task_engine
   *        The `Task_engine` on which the timer runs.
   * @param timeout
   *        How long.  Zero or negative cancels soon.
   */
  void cancel_after(flow::util::Task_engine* task_engine, util::Timeout timeout);

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Constructors.

  /// Constructs in non-canceled state without parents.
  Cancel_scope();

  // Methods.

  /**
   * Removes the given callback if still registered.
   *
   * @param id
   *        Callback ID.
   */
  void deregister(uint64_t id);

  /**
   * Makes `*this` a child of `parent`.  Called only during creation.
   *
   * @param parent
   *        Parent.
   */
  void link_to_parent(const Cancel_scope_ptr& parent);

  // Data.

  /// Protects the following members except #m_parent_registrations and #m_timer.
  mutable Mutex m_mutex;

  /// See canceled().
  bool m_canceled;

  /// ID for the next on_cancel() registration.
  uint64_t m_next_id;

  /// Registered callbacks not yet invoked, keyed by ID; so in order of registration.
  std::map<uint64_t, Function<void ()>> m_callbacks;

  /// Our callbacks in our parents; set only during creation.
  std::vector<Registration> m_parent_registrations;

  /// The cancel_after() timer, if any.
  boost::shared_ptr<boost::asio::steady_timer> m_timer;
}; // class Cancel_scope

} // namespace dedbg::session
