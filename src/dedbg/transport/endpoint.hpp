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
#include <cstdint>
#include <iosfwd>
#include <string>

namespace dedbg::transport
{

// Types.

/**
 * Where a debug server is listening: a WebSocket URI broken up into the pieces needed to reach it.
 * Obtain one via parse_server_uri(); it is a simple data store beyond that.
 */
struct Endpoint
{
  // Types.

  /// The WebSocket flavor.
  enum class Scheme
  {
    /// Plain WebSocket over TCP.
    S_WS,
    /// WebSocket over TLS over TCP.
    S_WSS
  };

  // Methods.

  /**
   * Returns `true` if and only if the connection shall be secured with TLS.
   * @return See above.
   */
  bool tls() const;

  /**
   * Value suitable for the HTTP `Host` header during the WebSocket handshake: host, bracketed if an IPv6 literal,
   * followed by `:port` unless the port is the scheme's default.
   *
   * @return See above.
   */
  std::string host_header() const;

  // Data.

  /// Scheme.  `http` and `https` URIs are rewritten to #Scheme::S_WS and #Scheme::S_WSS respectively.
  Scheme m_scheme = Scheme::S_WS;

  /// Host name or address literal; IPv6 literals are stored without the brackets.
  std::string m_host;

  /// TCP port; if not in the URI then 80 for `ws`/`http`, 443 for `wss`/`https`.
  uint16_t m_port = 0;

  /// Request target (path plus optional query); never empty (at least "/").
  std::string m_target;
}; // struct Endpoint

// Free functions.

/**
 * Parses a server address into an Endpoint.  Recognized schemes (case-insensitive) are `ws`, `wss`, `http`,
 * `https`; a web-style address (`http`, `https`) is transparently rewritten to its WebSocket counterpart
 * (`ws`, `wss`).  Any fragment is dropped.
 *
 * @param uri
 *        E.g., "http://debug-host:8080/des" or "wss://[::1]/des?x=1".
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        transport::error::Code::S_INVALID_URI, transport::error::Code::S_UNSUPPORTED_URI_SCHEME.
 * @return The Endpoint; meaningless if an error is emitted.
 */
Endpoint parse_server_uri(util::String_view uri, Error_code* err_code = 0);

/**
 * Prints string representation of the given Endpoint to the given `ostream`, in URI form.
 *
 * @relatesalso Endpoint
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Endpoint& val);

} // namespace dedbg::transport
