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
#include <string>

namespace dedbg::session
{

// Types.

/**
 * Configuration of a Client_debug_session.  This is a data store (and a simple one): fill it out, pass it by
 * `const` reference to the session constructor, which copies what it needs.  Only #m_server_uri has no
 * usable default.
 *
 * Loading this from a file, command line, etc., is up to the application.
 */
struct Session_config
{
  // Constants.

  /// The WebSocket sub-protocol that every dedbg session negotiates.
  static const std::string S_SUB_PROTOCOL;

  // Data.

  /**
   * Where the debug server listens: `ws://`, `wss://`, or their web-style equivalents `http://`, `https://`
   * (rewritten to `ws://`, `wss://`).  E.g., "http://localhost:8080/des".
   */
  std::string m_server_uri;

  /**
   * Requests sent without an explicit cancellation scope are canceled if no reply arrives within this long.
   * Zero means no timeout.  Adjustable later via Client_debug_session::set_default_timeout().
   */
  util::Timeout m_default_timeout = util::Timeout::zero();

  /// How long to wait before the next connect attempt after a failed one.  (After losing a connection: none.)
  util::Timeout m_reconnect_delay = std::chrono::seconds(1);

  /// Upper bound on establishing one connection: TCP connect plus TLS handshake, and separately WebSocket handshake.
  util::Timeout m_connect_timeout = std::chrono::seconds(30);

  /// Upper bound on the graceful close performed when the session is destroyed.
  util::Timeout m_close_timeout = std::chrono::seconds(1);

  /// Capacity of the receive buffer: larger incoming messages are rejected, and the connection closed.
  size_t m_recv_buffer_size = 1024 * 1024;

  /// For `wss` only: whether to verify the server's certificate chain (default trust store) and host name.
  bool m_verify_tls_peer = true;
}; // struct Session_config

// Free functions.

/**
 * Prints string representation of the given Session_config to the given `ostream`.
 *
 * @relatesalso Session_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Session_config& val);

} // namespace dedbg::session
