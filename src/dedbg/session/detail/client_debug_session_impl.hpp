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

#include "dedbg/session/detail/request_correlator.hpp"
#include "dedbg/session/session_config.hpp"
#include "dedbg/session/session_observer.hpp"
#include "dedbg/transport/message_stream.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/move/unique_ptr.hpp>
#include <atomic>
#include <iosfwd>
#include <vector>

namespace dedbg::session::detail
{

// Types.

/**
 * Internal, non-movable pImpl implementation of session::Client_debug_session.  It is the connection lifecycle
 * engine plus the request-sending half of request correlation; the facade adds the protocol operations on top.
 *
 * ### Threads ###
 * As in most of Flow-style async code, there is thread U (any user thread calling public methods, possibly many
 * concurrently) and thread W, our one internal worker (#m_async_worker).  Everything touching the physical
 * connection (#m_stream) happens in thread W: connecting, reading, writing, closing.  Observer hooks run in
 * thread W.  Thread U, in sync_request(), only: snapshots #m_conn; registers a Pending_request; posts the
 * transmission to thread W; and blocks on the Pending_request.
 *
 * ### State machine ###
 * Disconnected -> Connecting -> Open -> Disconnected (repeat) ... -> Disposed.  In thread W:
 *   - Connecting: start_connecting() obtains a fresh stream from the factory and `async_connect()`s it.
 *     On failure: on_connect_done() reports it to the observer (unless it is a repeat of #m_last_failure) and
 *     arms #m_reconnect_timer for Session_config::m_reconnect_delay, then back to Connecting.
 *   - Open: on_connect_done() creates a Connection (with a child of #m_session_scope as its Cancel_scope),
 *     publishes it in #m_conn, tells the observer, restores the use path, and starts the read loop (read_some(),
 *     on_read_some()).
 *   - Teardown (read failure, server close, message too large): teardown() withdraws #m_conn, cancels its scope
 *     (which cancels all requests waiting on it), tells the observer, discards the stream, and goes to Connecting
 *     right away.
 *   - Disposed: the destructor sets #m_disposing; closes gracefully; cancels #m_session_scope; stops thread W.
 *
 * ### Locks ###
 * #m_conn_mutex guards #m_conn.  The correlator's table has its own lock.  #m_use_path_mutex guards #m_use_path.
 * No two are ever held at once.
 */
class Client_debug_session_impl :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * See Client_debug_session ctor.  Begins connecting in the background immediately.
   *
   * @param logger_ptr
   *        See above.
   * @param config
   *        See above.
   * @param observer_or_null
   *        See above.
   * @param credential_provider_or_null
   *        See above.
   * @param stream_factory_or_null
   *        See above.
   */
  explicit Client_debug_session_impl(flow::log::Logger* logger_ptr, const Session_config& config,
                                     Session_observer* observer_or_null,
                                     Credential_provider* credential_provider_or_null,
                                     transport::Message_stream_factory* stream_factory_or_null);

  /// See Client_debug_session dtor.
  ~Client_debug_session_impl();

  // Methods.

  /**
   * See Client_debug_session::sync_request().
   *
   * @param envelope
   *        See above.
   * @param cancel_scope_or_null
   *        See above.
   * @param err_code
   *        See above.
   * @return See above.
   */
  Reply sync_request(Document&& envelope, const Cancel_scope_ptr& cancel_scope_or_null, Error_code* err_code);

  /**
   * See Client_debug_session::current_use_path().
   * @return See above.
   */
  std::string current_use_path() const;

  /**
   * Sets the value returned by current_use_path(); if that changes it, the observer is told (in thread W).
   *
   * @param use_path
   *        New value.
   */
  void set_current_use_path(const std::string& use_path);

  /**
   * See Client_debug_session::is_connected().
   * @return See above.
   */
  bool is_connected() const;

  /**
   * See Client_debug_session::pending_request_count().
   * @return See above.
   */
  size_t pending_request_count() const;

  /**
   * See Client_debug_session::default_timeout().
   * @return See above.
   */
  util::Timeout default_timeout() const;

  /**
   * See Client_debug_session::set_default_timeout().
   * @param timeout
   *        See above.
   */
  void set_default_timeout(util::Timeout timeout);

  /**
   * The server endpoint, as parsed from Session_config::m_server_uri.
   * @return See above.
   */
  const transport::Endpoint& endpoint() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /**
   * The part of an established connection visible to threads U.  The stream itself stays in thread W
   * (#m_stream); a Connection only identifies it (by address) and carries its Cancel_scope.
   */
  struct Connection
  {
    /// Canceled when the connection is torn down.  A child of #m_session_scope.
    Cancel_scope_ptr m_scope;
  };

  /// Short-hand for ref-counted pointer to Connection.
  using Connection_ptr = boost::shared_ptr<Connection>;

  // Methods.

  /// In thread W: begins a connect attempt (Connecting state).
  void start_connecting();

  /**
   * In thread W: completion handler of the `async_connect()` begun by start_connecting().
   *
   * @param err_code
   *        Result.
   */
  void on_connect_done(const Error_code& err_code);

  /// In thread W: arms #m_reconnect_timer to start_connecting() after Session_config::m_reconnect_delay.
  void schedule_reconnect();

  /// In thread W: after connecting, re-selects the remote node selected before; or selects the root.
  void restore_use_path();

  /// In thread W: reads more of the current message into #m_recv_buf.
  void read_some();

  /**
   * In thread W: completion handler of read_some().
   *
   * @param err_code
   *        Result.
   * @param n_rcvd
   *        Bytes read.
   * @param frame_info
   *        What they were.
   */
  void on_read_some(const Error_code& err_code, size_t n_rcvd, const transport::Frame_info& frame_info);

  /**
   * In thread W: handles one complete incoming text message.
   *
   * @param text
   *        The message.
   */
  void on_message(util::String_view text);

  /**
   * In thread W: routes a parsed incoming message by its token.
   *
   * @param doc
   *        The message.
   */
  void dispatch(Document&& doc);

  /**
   * In thread W: reports a communication fault to the observer, unless it is a repeat of #m_last_failure.
   *
   * @param err_code
   *        The fault.
   */
  void report_communication_fault(const Error_code& err_code);

  /// In thread W: Open -> Disconnected; then Connecting unless #m_disposing.
  void teardown();

  /**
   * Prints string representation of `*this` to the given `ostream`.
   *
   * @param os
   *        Stream to which to write.
   * @param val
   *        Object to serialize.
   * @return `os`.
   */
  friend std::ostream& operator<<(std::ostream& os, const Client_debug_session_impl& val);

  // Data.

  /// See ctor.
  const Session_config m_config;

  /// Parsed Session_config::m_server_uri.
  const transport::Endpoint m_endpoint;

  /// Used if no observer was given to ctor.
  Session_observer m_default_observer;

  /// Used if no credential provider was given to ctor.
  Credential_provider m_default_credential_provider;

  /// The observer; not null.
  Session_observer* const m_observer;

  /// The credential provider; not null.
  Credential_provider* const m_credential_provider;

  /// Created if no stream factory was given to ctor; else null.  Must outlive #m_async_worker.
  boost::movelib::unique_ptr<transport::Message_stream_factory> m_own_stream_factory;

  /// The stream factory; not null.
  transport::Message_stream_factory* const m_stream_factory;

  /// Set at the start of destruction; then no reconnects, no hooks.
  std::atomic<bool> m_disposing;

  /// See default_timeout(), in milliseconds.
  std::atomic<util::Timeout::rep> m_default_timeout_ms;

  /// Outstanding requests.
  Request_correlator m_correlator;

  /// Ancestor of every Connection's scope; canceled at destruction.
  const Cancel_scope_ptr m_session_scope;

  /// Protects #m_conn.
  mutable Mutex m_conn_mutex;

  /// The established connection, if any; null in any other state.  Protected by #m_conn_mutex.
  Connection_ptr m_conn;

  /// Protects #m_use_path.
  mutable Mutex m_use_path_mutex;

  /// See current_use_path().  Empty until first connected.  Protected by #m_use_path_mutex.
  std::string m_use_path;

  /// Thread W.
  mutable flow::async::Single_thread_task_loop m_async_worker;

  // The rest is accessed in thread W only.

  /// Paces connect attempts after a failure.
  boost::asio::steady_timer m_reconnect_timer;

  /// The stream being connected, or the established one; null otherwise.
  std::unique_ptr<transport::Message_stream> m_stream;

  /// Same as #m_conn, but for thread W without locking.
  Connection_ptr m_conn_w;

  /// Receive buffer; its size is Session_config::m_recv_buffer_size.
  std::vector<char> m_recv_buf;

  /// Bytes of the current message so far at the start of #m_recv_buf.
  size_t m_recv_size;

  /// Token of the use-path-restoring `use` request awaiting its reply; 0 if none.
  token_t m_use_token;

  /**
   * The last reported connect failure or communication fault, for deduplication.  Survives successful connects;
   * cleared by a malformed message, or when the observer asks to hear about repeats.
   */
  Error_code m_last_failure;
}; // class Client_debug_session_impl

} // namespace dedbg::session::detail
