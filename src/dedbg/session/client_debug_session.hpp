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
#include "dedbg/session/client_value.hpp"
#include "dedbg/session/reply.hpp"
#include "dedbg/session/session_config.hpp"
#include "dedbg/session/session_observer.hpp"
#include "dedbg/transport/message_stream.hpp"
#include <boost/move/unique_ptr.hpp>
#include <iosfwd>
#include <string>

namespace dedbg::session
{

namespace detail
{
class Client_debug_session_impl;
}

// Types.

/**
 * A client-side debug session: keeps one connection to a debug server alive (reconnecting as needed), and lets any
 * number of threads send it commands and synchronously await their replies.
 *
 * ### How to use ###
 * Construct with a Session_config (at least Session_config::m_server_uri).  The ctor returns at once; the session
 * connects in the background, and keeps reconnecting whenever the connection is lost or an attempt fails, until
 * `*this` is destroyed.  Supply a Session_observer to learn of those events; a Credential_provider if the server
 * requires credentials.
 *
 * Then invoke the operations: use() selects a remote node (the "use path") against which later commands execute;
 * execute() runs a command there and returns its result values; list_members() returns the members of the selected
 * node; list() returns the node tree.  sync_request() sends any envelope.  Each blocks the calling thread until:
 *   - the reply arrives (success, or a Remote_fault);
 *   - the request is canceled: the supplied Cancel_scope (if any) is canceled; or, absent one, the default
 *     timeout (if any; see set_default_timeout()) elapses; or the connection is lost; or `*this` is being
 *     destroyed.
 *
 * The use path survives reconnects: after reconnecting, the session re-selects it on its own.
 *
 * ### Error handling ###
 * As usual in Flow-style APIs, each operation takes a trailing `Error_code* err_code`.  If null, errors are
 * thrown as `flow::error::Runtime_error`, except a remote fault, which is thrown as Remote_fault (itself a
 * `Runtime_error`).  If not null, `*err_code` is set to the error (or cleared on success), and nothing is thrown.
 * Possible errors:
 *   - error::Code::S_NOT_CONNECTED: not connected at the time of the call.  Nothing was sent.
 *   - error::Code::S_REQUEST_CANCELED: see above.
 *   - error::Code::S_REMOTE_FAULT: the server replied with an error.
 *   - A transport error: the request could not be sent.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.  Observer hooks run in an internal thread; they must not call
 * the operations above (which would wait forever) nor destroy `*this`.
 */
class Client_debug_session
{
public:
  // Constructors/destructor.

  /**
   * Constructs the session and begins connecting in the background.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   * @param config
   *        Configuration; copied.
   * @param observer_or_null
   *        Receives lifecycle events; or null to ignore them.  Must outlive `*this`.
   * @param credential_provider_or_null
   *        Supplies credentials per connect attempt; or null for none.  Must outlive `*this`.
   * @param stream_factory_or_null
   *        Creates the physical connections; or null for WebSocket (Ws_message_stream_factory).
   *        Must outlive `*this`.
   * @throws flow::error::Runtime_error
   *         If Session_config::m_server_uri is not valid (transport::parse_server_uri()).
   */
  explicit Client_debug_session(flow::log::Logger* logger_ptr, const Session_config& config,
                                Session_observer* observer_or_null = 0,
                                Credential_provider* credential_provider_or_null = 0,
                                transport::Message_stream_factory* stream_factory_or_null = 0);

  /**
   * Closes the connection (gracefully, if possible, within Session_config::m_close_timeout); cancels all
   * outstanding requests; and returns once no more observer hooks can run.
   */
  ~Client_debug_session();

  // Methods.

  /**
   * Selects the remote node against which later commands execute.  On success current_use_path() becomes the
   * path the server reports (and the observer is told, if it changed).  On remote fault it becomes `/`.
   *
   * @param node_path
   *        Remote node path.
   * @param cancel_scope
   *        If not null, canceling it cancels the wait.
   * @param err_code
   *        See class doc header.
   * @return The new use path; empty on error.
   */
  std::string use(util::String_view node_path, const Cancel_scope_ptr& cancel_scope = Cancel_scope_ptr(),
                  Error_code* err_code = 0);

  /**
   * Executes a command in the context of the current use path.
   *
   * @param command
   *        Command text.
   * @param cancel_scope
   *        See use().
   * @param err_code
   *        See class doc header.
   * @return The result values, in order; empty on error.
   */
  Client_value::Table execute(util::String_view command, const Cancel_scope_ptr& cancel_scope = Cancel_scope_ptr(),
                              Error_code* err_code = 0);

  /**
   * Lists the members of the node at the current use path.
   *
   * @param cancel_scope
   *        See use().
   * @param err_code
   *        See class doc header.
   * @return See execute().
   */
  Client_value::Table list_members(const Cancel_scope_ptr& cancel_scope = Cancel_scope_ptr(),
                                   Error_code* err_code = 0);

  /**
   * Enumerates the remote node tree.
   *
   * @param recursive
   *        Whether to descend into child nodes.
   * @param cancel_scope
   *        See use().
   * @param err_code
   *        See class doc header.
   * @return The reply document, as sent; empty on error.
   */
  Document list(bool recursive, const Cancel_scope_ptr& cancel_scope = Cancel_scope_ptr(), Error_code* err_code = 0);

  /**
   * Sends the given envelope (after stamping a token onto it) and awaits the reply.  Unlike the operations above,
   * a remote fault or cancellation is not an error here: it is reported via the returned Reply.
   *
   * @param envelope
   *        Request document, e.g., from make_execute_envelope().
   * @param cancel_scope
   *        See use().
   * @param err_code
   *        See class doc header.  Only S_NOT_CONNECTED or a transport error is possible.
   * @return The reply; canceled on error.
   */
  Reply sync_request(Document&& envelope, const Cancel_scope_ptr& cancel_scope = Cancel_scope_ptr(),
                     Error_code* err_code = 0);

  /**
   * The currently selected remote node path; empty until first connected, then `/` until use() changes it.
   * @return See above.
   */
  std::string current_use_path() const;

  /**
   * Whether the connection is established right now.
   * @return See above.
   */
  bool is_connected() const;

  /**
   * Number of requests sent (or being sent) and still awaiting a reply.  A request stops counting once its
   * send-and-wait call returns, however it ended.
   *
   * @return See above.
   */
  size_t pending_request_count() const;

  /**
   * Timeout applied to requests sent without a Cancel_scope; zero means none.
   * @return See above.
   */
  util::Timeout default_timeout() const;

  /**
   * Changes default_timeout() for requests sent from now on.
   * @param timeout
   *        New value; negative is taken as zero.
   */
  void set_default_timeout(util::Timeout timeout);

  /**
   * The server endpoint, as parsed from Session_config::m_server_uri.
   * @return See above.
   */
  const transport::Endpoint& endpoint() const;

private:
  // Methods.

  /**
   * Converts a Reply into success or error, as documented in the class doc header.
   *
   * @param reply
   *        Result of `m_impl->sync_request()`.
   * @param send_err_code
   *        Error from `m_impl->sync_request()`.
   * @param err_code
   *        See class doc header.
   * @param context
   *        For the exception, if one is thrown.
   * @return `true` on success.
   */
  static bool unwrap(const Reply& reply, const Error_code& send_err_code, Error_code* err_code,
                     util::String_view context);

  // Friends.

  // Friend of Client_debug_session: For access to `m_impl`.
  friend std::ostream& operator<<(std::ostream& os, const Client_debug_session& val);

  // Data.

  /// The true implementation of `*this`.
  boost::movelib::unique_ptr<detail::Client_debug_session_impl> m_impl;
}; // class Client_debug_session

// Free functions.

/**
 * Prints string representation of the given Client_debug_session to the given `ostream`.
 *
 * @relatesalso Client_debug_session
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Client_debug_session& val);

} // namespace dedbg::session
