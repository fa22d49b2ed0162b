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
#include <iosfwd>

/**
 * Namespace containing the dedbg::session module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  transport::error is the
 * analogous thing for dedbg::transport; errors from there (and from boost.asio/boost.beast underneath) can also
 * reach the user of session APIs.
 *
 * Note that a cancelled request (caller's signal, timeout, disconnect, session shutdown) is reported as
 * Code::S_REQUEST_CANCELED; and a server-reported error as Code::S_REMOTE_FAULT.  The two are never conflated with
 * each other or with a transport error.
 */
namespace dedbg::session::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by dedbg::session functions/methods *outside of*
 * dedbg::transport-triggered errors and possibly system-triggered errors.
 */
enum class Code
{
  /// Request not sent: the debug session is not connected to the server at this time.
  S_NOT_CONNECTED = S_CODE_LOWEST_INT_VALUE,

  /**
   * Request abandoned before its reply arrived: the caller's cancellation signal fired, or the timeout elapsed,
   * or the connection on which it was sent was lost.
   */
  S_REQUEST_CANCELED,

  /// The server replied to the request with an exception envelope instead of a result.
  S_REMOTE_FAULT,

  /// An incoming message could not be parsed as a well-formed document.
  S_MALFORMED_MESSAGE,

  /// An incoming message exceeded the receive buffer capacity; connection closed.
  S_MESSAGE_TOO_LARGE,

  /// Async completion handler is being called prematurely, because underlying object is shutting down, as user desires.
  S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER,

  /// Session configuration is invalid: the receive buffer capacity is zero.
  S_INVALID_CONFIG,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight flow::Error_code (boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()` template
 * implementation work.  Or, slightly more in English, it glues the (completely general) `Error_code`
 * to the (dedbg::session-specific) error code set `Code`.
 *
 * @param err_code
 *        `enum` value.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a session::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - "<...>" (case-insensitive), where <...> is the symbol of the `enum` member sans the "S_" prefix;
 *   - the numeric value of the `enum` member.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a session::error::Code to a standard output stream.  The output is the symbol of the `enum`
 * member sans the "S_" prefix.  operator>>() will recognize it.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace dedbg::session::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system accepts `enum` `Code` as convertible to `Error_code`.
 * The non-specialized version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used
 * as `Error_code`s.  This is the offical way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::dedbg::session::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
