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

#include "dedbg/session/detail/pending_request.hpp"
#include <boost/random/mersenne_twister.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>

namespace dedbg::session::detail
{

// Types.

/// Short-hand for ref-counted pointer to Pending_request.
using Pending_request_ptr = boost::shared_ptr<Pending_request>;

/**
 * The table of outstanding requests, keyed by token.  Assigns tokens; registers a Pending_request per request
 * expecting a reply; hands it over to the receiver of the matching reply via take(); and removes it when the
 * request is abandoned (send failure; or the waiter giving up after cancellation).
 *
 * Tokens are drawn from a per-`*this` pseudo-random generator seeded at construction, uniformly from
 * `[1, INT32_MAX]`.  A draw equal to the token of a currently registered request, or of a reserved token, is
 * discarded and redrawn; so tokens are unique among outstanding requests and reserved tokens.  A reserved token
 * (reserve_token()) belongs to a request whose reply the session consumes itself, without a Pending_request.
 *
 * Cancellation: register_request() links the new Pending_request to the given Cancel_scope, so that canceling
 * the scope cancels the request.  The link holds the request weakly.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently with each other.  The table has its own lock, independent of any
 * other lock in the session.
 */
class Request_correlator :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs an empty table and seeds the token generator.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Request_correlator(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Draws a fresh token not currently registered or reserved; and reserves it (without creating a
   * Pending_request) until release_token().  take() does not return anything for it.
   *
   * @return See above.  Not 0.
   */
  token_t reserve_token();

  /**
   * Releases a token returned by reserve_token(), so it may be drawn again.  No-op if not reserved.
   *
   * @param token
   *        See above.
   */
  void release_token(token_t token);

  /**
   * Whether the given token is currently reserved.
   *
   * @param token
   *        See above.
   * @return See above.
   */
  bool is_reserved(token_t token) const;

  /**
   * Draws a fresh token; creates a Pending_request with it; registers it; links it to `cancel_scope`.  If that
   * scope is already canceled, the returned request is already complete (canceled) but still registered.
   *
   * @param cancel_scope
   *        Canceling this cancels the request.  Must not be null.
   * @return The request.  Not null.
   */
  Pending_request_ptr register_request(const Cancel_scope_ptr& cancel_scope);

  /**
   * Removes the given request from the table, if it is still there.  No-op otherwise.
   *
   * @param req
   *        Request returned by register_request().
   */
  void unregister(const Pending_request_ptr& req);

  /**
   * Removes and returns the request registered under the given token; null if none.
   *
   * @param token
   *        Token from a reply.
   * @return See above.
   */
  Pending_request_ptr take(token_t token);

  /**
   * Number of registered requests.
   * @return See above.
   */
  size_t pending_count() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Draws a token in neither #m_pending nor #m_reserved.  #m_mutex must be locked.
   * @return See above.
   */
  token_t next_token_locked();

  // Data.

  /// Protects the following members.
  mutable Mutex m_mutex;

  /// Token source.
  boost::random::mt19937 m_token_gen;

  /// The outstanding requests.
  boost::unordered_map<token_t, Pending_request_ptr> m_pending;

  /// See reserve_token().
  boost::unordered_set<token_t> m_reserved;
}; // class Request_correlator

} // namespace dedbg::session::detail
