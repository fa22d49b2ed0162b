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

#include "dedbg/session/remote_fault.hpp"
#include <iosfwd>
#include <optional>

namespace dedbg::session
{

// Types.

/**
 * The terminal state of one request: exactly one of a reply document, a remote fault, or cancellation.
 * Obtained from Client_debug_session::sync_request().
 */
class Reply
{
public:
  // Types.

  /// The three possible terminal states.
  enum class Outcome
  {
    /// The server replied with a result document.
    S_REPLY,
    /// The server replied with an `exception` envelope; see fault().
    S_REMOTE_FAULT,
    /// Abandoned before a reply arrived: caller's signal, timeout, disconnect, or session shutdown.
    S_CANCELED
  };

  // Constructors/destructor.

  /// Constructs a #Outcome::S_CANCELED reply.
  Reply();

  /**
   * Constructs a reply from a received document: #Outcome::S_REMOTE_FAULT if its root tag is `exception`,
   * else #Outcome::S_REPLY.
   *
   * @param doc
   *        The received document.
   */
  explicit Reply(Document&& doc);

  // Methods.

  /**
   * See Outcome.
   * @return See above.
   */
  Outcome outcome() const;

  /**
   * Same as `outcome() == S_CANCELED`.
   * @return See above.
   */
  bool canceled() const;

  /**
   * The received document (for a remote fault, the `exception` envelope); empty if canceled.
   * @return See above.
   */
  const Document& document() const;

  /**
   * The remote fault if outcome() is #Outcome::S_REMOTE_FAULT; else empty.
   * @return See above.
   */
  std::optional<Remote_fault> fault() const;

private:
  // Data.

  /// See outcome().
  Outcome m_outcome;

  /// See document().
  Document m_doc;
}; // class Reply

// Free functions.

/**
 * Prints string representation of the given Reply::Outcome to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Reply::Outcome val);

} // namespace dedbg::session
