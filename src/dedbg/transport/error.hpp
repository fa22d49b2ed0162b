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
 * Namespace containing the dedbg::transport module's extension of boost.system error conventions.  Errors
 * emitted by transport::Message_stream implementations are either from this set, or from boost.asio
 * (`boost::asio::error::...`), boost.beast (`boost::beast::websocket::error::...`, `boost::beast::error::timeout`)
 * and the system.
 *
 * @see session::error which follows the same conventions.
 */
namespace dedbg::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/// All possible errors returned (via `Error_code` arguments) by dedbg::transport functions/methods themselves.
enum class Code
{
  /// Server address could not be parsed as a URI of the form scheme://host[:port][/target].
  S_INVALID_URI = S_CODE_LOWEST_INT_VALUE,

  /// Server address URI scheme is not one of ws, wss, http, https.
  S_UNSUPPORTED_URI_SCHEME,

  /// The server accepted the WebSocket handshake but did not select the required sub-protocol.
  S_SUB_PROTOCOL_REJECTED,

  /// Operation requires an open stream, but the stream is not open.
  S_STREAM_NOT_OPEN,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Analogous to session::error::make_error_code().
 *
 * @param err_code
 *        See above.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Analogous to session::error::operator>>().
 *
 * @param is
 *        See above.
 * @param val
 *        See above.
 * @return See above.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Analogous to session::error::operator<<().
 *
 * @param os
 *        See above.
 * @param val
 *        See above.
 * @return See above.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace dedbg::transport::error

namespace boost::system
{

// Types.

/// See note in similar place near session::error.
template<>
struct is_error_code_enum<::dedbg::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
