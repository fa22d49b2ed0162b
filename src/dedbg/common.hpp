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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/unordered_map.hpp>
#include <chrono>
#include <string>

/**
 * Catch-all namespace for the dedbg project: a client for the `dedbg` remote interactive debugging protocol.
 *
 * The interesting stuff is in the two sub-namespaces:
 *   - dedbg::transport: a physical message-oriented connection to a debug server (a WebSocket, by default),
 *     abstracted as transport::Message_stream; plus the parsing of server addresses.
 *   - dedbg::session: the client-side debug session proper.  session::Client_debug_session keeps a persistent
 *     connection to the server, reconnecting as needed; it serializes commands as XML envelopes; it correlates
 *     replies to requests by token; and it turns value-bearing replies into typed session::Client_value trees.
 *
 * This namespace itself contains only a few common type aliases and the log-component `enum`.
 */
namespace dedbg
{

// Types.

/// Short-hand for Flow's `Error_code` which is `boost::system::error_code`.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic function (a-la `std::function<>`).
template<typename Signature>
using Function = flow::Function<Signature>;

/**
 * The `flow::log::Component` payload `enum` for all of dedbg.  To register the names with your
 * `flow::log::Config`, use #S_DEDBG_LOG_COMPONENT_NAME_MAP.
 */
enum class Log_component
{
  /// Uncategorized.
  S_UNCAT = 0,
  /// Session lifecycle, request correlation.
  S_SESSION,
  /// Physical connection/stream.
  S_TRANSPORT,
  /// Value marshalling.
  S_VALUE,
  /// SENTINEL: Not a component.  Used for counting only.
  S_END_SENTINEL
};

/**
 * The map from each Log_component to its human-readable name; suitable for
 * `flow::log::Config::init_component_names()`.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_DEDBG_LOG_COMPONENT_NAME_MAP;

/**
 * Utility types and functions used throughout dedbg.
 */
namespace util
{

/// Short-hand for Flow's `String_view`.
using flow::util::String_view;

/// The duration type used for all timeouts, delays and such throughout dedbg.
using Timeout = std::chrono::milliseconds;

} // namespace util

} // namespace dedbg
