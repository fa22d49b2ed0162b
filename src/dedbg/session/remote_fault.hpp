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

#include "dedbg/session/envelope.hpp"
#include <flow/error/error.hpp>
#include <iosfwd>
#include <optional>
#include <string>

namespace dedbg::session
{

// Types.

/**
 * A server-reported error: the reply to a request was an `exception` envelope
 * (`<exception message=".." type=".."><stackTrace>..</stackTrace></exception>`) instead of a result.
 *
 * As a `flow::error::Runtime_error`, code() is session::error::Code::S_REMOTE_FAULT, and `what()` includes
 * the remote type and message.  Client_debug_session throws this (when no `Error_code*` is supplied) if the reply
 * to its request was a remote fault; Reply::fault() exposes it otherwise.
 */
class Remote_fault :
  public flow::error::Runtime_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs the fault from the root element of an `exception` reply.  Missing attributes get defaults:
   * message `No message`, type `Exception`.
   *
   * @param exception_element
   *        root_element() of the reply.
   */
  explicit Remote_fault(const Document& exception_element);

  // Methods.

  /**
   * The remote exception message.
   * @return See above.
   */
  const std::string& message() const;

  /**
   * The remote exception category (type name).
   * @return See above.
   */
  const std::string& exception_type() const;

  /**
   * The remote stack trace (text of the `stackTrace` child); empty if none was sent.
   * @return See above.
   */
  const std::optional<std::string>& remote_stack_trace() const;

private:
  // Data.

  /// See message().
  std::string m_message;

  /// See exception_type().
  std::string m_exception_type;

  /// See remote_stack_trace().
  std::optional<std::string> m_remote_stack_trace;
}; // class Remote_fault

// Free functions.

/**
 * Prints string representation of the given Remote_fault to the given `ostream`.
 *
 * @relatesalso Remote_fault
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Remote_fault& val);

} // namespace dedbg::session
