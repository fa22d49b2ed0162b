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

#include "dedbg/transport/endpoint.hpp"
#include <flow/async/async_fwd.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/core/noncopyable.hpp>
#include <memory>
#include <optional>

namespace dedbg::transport
{

// Types.

/// User name and password presented to the server while establishing a connection (HTTP Basic authorization).
struct Credentials
{
  // Data.

  /// User name.
  std::string m_user_name;

  /// Password.
  std::string m_password;
};

/// Describes the data delivered by one Message_stream::async_read_some() completion.
struct Frame_info
{
  // Data.

  /// `true` if the message being received is text; `false` if binary.
  bool m_text = true;

  /// `true` if and only if the transport signaled end-of-message with the bytes just delivered.
  bool m_end_of_message = false;
};

/// The WebSocket close status sent by Message_stream::async_close().
enum class Close_status
{
  /// Normal closure.
  S_NORMAL,
  /// The peer sent a message too large to process.
  S_MESSAGE_TOO_BIG
};

/**
 * A single physical, message-oriented, full-duplex connection to a debug server; e.g., a WebSocket.  An object
 * of this type represents one connection attempt only: once it is closed or fails, it is discarded, and
 * a fresh one is obtained from Message_stream_factory for the next attempt.
 *
 * ### Thread safety ###
 * All methods except is_open() must be called from the thread running the `Task_engine` given to
 * Message_stream_factory::create_stream(), and all completion handlers execute in that thread.  is_open() may be
 * called from any thread concurrently with anything.
 *
 * ### Ordering ###
 * At most one async_read_some() may be outstanding at a time.  async_send() may be invoked any number of times
 * without waiting for preceding completions; messages go out in the order of invocation.
 *
 * ### Cancellation ###
 * cancel() hard-aborts the connection: all outstanding operations complete (soon, not synchronously) with
 * `boost::asio::error::operation_aborted` or some other truthy error.
 */
class Message_stream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Message_stream();

  // Methods.

  /**
   * Opens the connection to the given endpoint.  On success is_open() becomes `true` before `on_done_func()`
   * executes.
   *
   * @param endpoint
   *        Where.
   * @param credentials_or_none
   *        If not `nullopt`, presented to the server while opening.
   * @param sub_protocol
   *        The application sub-protocol the server must agree to speak.
   * @param on_done_func
   *        Completion handler; falsy `Error_code` on success.
   */
  virtual void async_connect(const Endpoint& endpoint, const std::optional<Credentials>& credentials_or_none,
                             util::String_view sub_protocol, flow::async::Task_asio_err&& on_done_func) = 0;

  /**
   * Reads bytes of the current incoming message (or the next one, if the last one has been fully read) into
   * the given buffer, not waiting for more than are available.  The handler is given how many bytes landed in
   * `target` and whether they complete a message.
   *
   * A graceful close by the opposing side is reported as `boost::beast::websocket::error::closed`.
   *
   * @param target
   *        Where to write the bytes.  Must stay valid until handler executes.  Must have non-zero size.
   * @param on_done_func
   *        Completion handler.
   */
  virtual void async_read_some(boost::asio::mutable_buffer target,
                               Function<void (const Error_code& err_code, size_t n_rcvd,
                                              const Frame_info& frame_info)>&& on_done_func) = 0;

  /**
   * Sends the given text as one complete message.
   *
   * @param text_msg
   *        Message body.
   * @param on_done_func
   *        Completion handler.  Truthy `Error_code` means the message was not (entirely) sent.
   */
  virtual void async_send(std::string&& text_msg, flow::async::Task_asio_err&& on_done_func) = 0;

  /**
   * Starts a graceful close: sends a close frame with the given status and reason, and awaits the opposing one.
   * Any outstanding async_read_some() completes with an error once the close completes.
   *
   * @param status
   *        Close status.
   * @param reason
   *        Brief human-readable reason.
   * @param on_done_func
   *        Completion handler.
   */
  virtual void async_close(Close_status status, util::String_view reason,
                           flow::async::Task_asio_err&& on_done_func) = 0;

  /// Hard-aborts the connection and all outstanding operations.  Idempotent.
  virtual void cancel() = 0;

  /**
   * Returns `true` if and only if async_connect() succeeded, and the connection has not since failed or closed.
   * Thread-safe.
   *
   * @return See above.
   */
  virtual bool is_open() const = 0;
}; // class Message_stream

/**
 * Creates a fresh Message_stream for each connection attempt.  Implement this to supply a transport other than
 * the default (Ws_message_stream_factory), such as a test double.
 */
class Message_stream_factory :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Message_stream_factory();

  // Methods.

  /**
   * Creates a not-yet-connected Message_stream whose async operations shall use `task_engine`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param task_engine
   *        The `Task_engine` (boost.asio `io_context`) running in the thread from which the stream shall be used.
   * @return See above.  Not null.
   */
  virtual std::unique_ptr<Message_stream> create_stream(flow::log::Logger* logger_ptr,
                                                        flow::util::Task_engine* task_engine) = 0;
}; // class Message_stream_factory

} // namespace dedbg::transport
