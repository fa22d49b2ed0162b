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

#include "dedbg/session/cancel_scope.hpp"
#include "dedbg/session/reply.hpp"
#include <boost/thread/future.hpp>
#include <iosfwd>
#include <optional>

namespace dedbg::session::detail
{

// Types.

/**
 * A request awaiting its reply: a one-shot result slot with three terminal states (see Reply::Outcome), plus
 * a fourth for the case where the request could not be transmitted at all (fail()).
 * The first of resolve(), cancel() and fail() to be invoked completes it; any later one is a no-op that returns
 * `false`.  Once complete, wait() returns immediately.
 *
 * The request is linked to a Cancel_scope via set_cancel_registration(); completion releases that registration.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently with each other.
 */
class Pending_request :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the request in not-complete state.
   *
   * @param token
   *        Token stamped on the outgoing envelope.
   */
  explicit Pending_request(token_t token);

  // Methods.

  /**
   * See ctor.
   * @return See above.
   */
  token_t token() const;

  /**
   * Completes `*this` with the given reply (a result or a remote fault), unless already complete.
   *
   * @param reply
   *        Reply.
   * @return `true` if and only if this call completed `*this`.
   */
  bool resolve(Reply&& reply);

  /**
   * Completes `*this` as canceled, unless already complete.
   * @return `true` if and only if this call completed `*this`.
   */
  bool cancel();

  /**
   * Completes `*this` as not sent, unless already complete.  wait() then yields a canceled Reply, and
   * send_error() the given code.
   *
   * @param err_code
   *        Why the request could not be sent.  Must be truthy.
   * @return `true` if and only if this call completed `*this`.
   */
  bool fail(const Error_code& err_code);

  /**
   * If `*this` was completed by fail(), the code given to it; else falsy.
   * @return See above.
   */
  Error_code send_error() const;

  /**
   * Whether `*this` is complete.
   * @return See above.
   */
  bool done() const;

  /**
   * Blocks until `*this` is complete; then returns the result.
   * @return See above.  Valid as long as `*this` exists.
   */
  const Reply& wait() const;

  /**
   * Saves the registration of our cancellation callback, so that it is released upon completion.  If already
   * complete, releases it at once.
   *
   * @param cancel_registration
   *        Registration.
   */
  void set_cancel_registration(Cancel_scope::Registration&& cancel_registration);

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Methods.

  /**
   * Implements resolve(), cancel() and fail().
   *
   * @param reply
   *        Result.
   * @param send_err_code
   *        See send_error().
   * @return See resolve().
   */
  bool complete(Reply&& reply, const Error_code& send_err_code);

  // Data.

  /// See ctor.
  const token_t m_token;

  /// Protects the following members except the future.
  mutable Mutex m_mutex;

  /// Whether complete.
  bool m_done;

  /// The result; set once, when #m_done becomes `true`.
  std::optional<Reply> m_reply;

  /// See send_error().
  Error_code m_send_err_code;

  /// Fulfilled upon completion.
  boost::promise<void> m_done_promise;

  /// The future of #m_done_promise, for wait().
  boost::shared_future<void> m_done_future;

  /// See set_cancel_registration().
  Cancel_scope::Registration m_cancel_registration;
}; // class Pending_request

// Free functions.

/**
 * Prints string representation of the given Pending_request to the given `ostream`.
 *
 * @relatesalso Pending_request
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Pending_request& val);

} // namespace dedbg::session::detail
