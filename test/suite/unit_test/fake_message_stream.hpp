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

#include "dedbg/transport/message_stream.hpp"
#include <boost/shared_ptr.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace dedbg::test
{

// Types.

class Fake_server;

/**
 * In-memory stand-in for one physical connection, driven by a Fake_server.  Like the real thing, every method
 * except is_open() is invoked in the session's thread W, and every completion handler is posted onto its
 * `Task_engine` (never invoked synchronously).
 */
class Fake_message_stream :
  public transport::Message_stream
{
public:
  // Types.

  /// One unit of inbound data, or an inbound failure.
  struct Inbound
  {
    /// Payload.
    std::string m_data;
    /// See transport::Frame_info::m_text.
    bool m_text = true;
    /// See transport::Frame_info::m_end_of_message.
    bool m_end_of_message = true;
    /// If truthy, the read fails with this instead.
    Error_code m_err_code;
  };

  /// State shared with Fake_server.  Except #m_open, accessed only in the `Task_engine` thread.
  struct Wire
  {
    /// The session's `Task_engine`.
    flow::util::Task_engine* m_task_engine = nullptr;
    /// See is_open().
    std::atomic<bool> m_open{false};
    /// Queued inbound data not yet read.
    std::deque<Inbound> m_inbound;
    /// Target of the outstanding async_read_some(), if any.
    boost::asio::mutable_buffer m_read_target;
    /// Handler of the outstanding async_read_some(); empty if none.
    Function<void (const Error_code&, size_t, const transport::Frame_info&)> m_read_handler;

    /// Completes the outstanding read, if any, from #m_inbound, if not empty.
    void pump();
  };

  /// Short-hand for ref-counted pointer to Wire.
  using Wire_ptr = boost::shared_ptr<Wire>;

  // Constructors/destructor.

  /**
   * Constructs.
   *
   * @param server
   *        Owner of the fake server side.
   * @param task_engine
   *        Where handlers are posted.
   */
  explicit Fake_message_stream(Fake_server* server, flow::util::Task_engine* task_engine);

  // Methods.

  void async_connect(const transport::Endpoint& endpoint,
                     const std::optional<transport::Credentials>& credentials_or_none,
                     util::String_view sub_protocol, flow::async::Task_asio_err&& on_done_func) override;
  void async_read_some(boost::asio::mutable_buffer target,
                       Function<void (const Error_code& err_code, size_t n_rcvd,
                                      const transport::Frame_info& frame_info)>&& on_done_func) override;
  void async_send(std::string&& text_msg, flow::async::Task_asio_err&& on_done_func) override;
  void async_close(transport::Close_status status, util::String_view reason,
                   flow::async::Task_asio_err&& on_done_func) override;
  void cancel() override;
  bool is_open() const override;

private:
  // Data.

  /// See ctor.
  Fake_server* const m_server;

  /// Shared with #m_server.
  const Wire_ptr m_wire;
}; // class Fake_message_stream

/**
 * The fake server side, shared by all Fake_message_stream objects its factory creates.  Its methods are invoked
 * from the test thread; they post onto the session's thread W where needed.
 */
class Fake_server :
  public transport::Message_stream_factory
{
public:
  // Methods.

  std::unique_ptr<transport::Message_stream> create_stream(flow::log::Logger* logger_ptr,
                                                           flow::util::Task_engine* task_engine) override;

  /**
   * Makes subsequent connect attempts fail with the given error; or succeed if it is falsy.
   * @param err_code
   *        See above.
   */
  void set_connect_error(const Error_code& err_code);

  /**
   * Makes subsequent client sends fail with the given error (the message is not recorded); or succeed if it is
   * falsy.
   *
   * @param err_code
   *        See above.
   */
  void set_send_error(const Error_code& err_code);

  /**
   * Waits until a connection is open.
   * @param timeout
   *        How long at most.
   * @return `false` on timeout.
   */
  bool wait_connected(util::Timeout timeout = std::chrono::seconds(5));

  /**
   * Waits until the given number of connect attempts were made in total.
   * @param n_attempts
   *        See above.
   * @param timeout
   *        How long at most.
   * @return `false` on timeout.
   */
  bool wait_connect_attempts(size_t n_attempts, util::Timeout timeout = std::chrono::seconds(5));

  /**
   * Pops the oldest message the client sent that was not yet popped; waiting for one if needed.
   * @param timeout
   *        How long at most.
   * @return The message; empty on timeout.
   */
  std::string wait_sent(util::Timeout timeout = std::chrono::seconds(5));

  /**
   * Delivers a text message to the client over the current connection, split into frames of the given size.
   *
   * @param text
   *        Message.
   * @param frame_size
   *        Frame size; 0 means one frame.
   */
  void send_to_client(const std::string& text, size_t frame_size = 0);

  /**
   * Delivers a binary message to the client over the current connection.
   * @param data
   *        Message.
   */
  void send_binary_to_client(const std::string& data);

  /// Fails the current connection as if the network broke.
  void drop_connection();

  /// Closes the current connection normally from the server side.
  void close_connection();

  /**
   * Number of connect attempts so far.
   * @return See above.
   */
  size_t connect_attempts() const;

  /**
   * Close statuses sent by the client so far, in order.
   * @return See above.
   */
  std::vector<transport::Close_status> closes() const;

  /**
   * Credentials presented on the latest connect attempt.
   * @return See above.
   */
  std::optional<transport::Credentials> last_credentials() const;

  /**
   * Sub-protocol requested on the latest connect attempt.
   * @return See above.
   */
  std::string last_sub_protocol() const;

private:
  // Friends.

  // Friend of Fake_server: For the on_*() callbacks.
  friend class Fake_message_stream;

  // Methods.

  /**
   * Records a connect attempt.
   *
   * @param credentials_or_none
   *        Presented credentials.
   * @param sub_protocol
   *        Requested sub-protocol.
   * @return The error to fail it with; falsy to succeed.
   */
  Error_code on_connect(const std::optional<transport::Credentials>& credentials_or_none,
                        util::String_view sub_protocol);

  /**
   * Makes the given wire the current connection.
   * @param wire
   *        See above.
   */
  void on_open(const Fake_message_stream::Wire_ptr& wire);

  /**
   * Records a message from the client, unless sends are set to fail.
   *
   * @param text
   *        See above.
   * @return The error to fail the send with; falsy to succeed.
   */
  Error_code on_sent(const std::string& text);

  /**
   * Records a close from the client; that connection is no longer current.
   *
   * @param wire
   *        The connection.
   * @param status
   *        See above.
   */
  void on_close(const Fake_message_stream::Wire_ptr& wire, transport::Close_status status);

  /**
   * The given connection was aborted by the client; it is no longer current.
   * @param wire
   *        The connection.
   */
  void on_gone(const Fake_message_stream::Wire_ptr& wire);

  /**
   * Delivers inbound units over the current connection, if any.
   *
   * @param units
   *        See above.
   * @param then_close
   *        If `true`, the current connection stops being current.
   */
  void deliver(std::vector<Fake_message_stream::Inbound>&& units, bool then_close);

  // Data.

  /// Protects everything below.
  mutable std::mutex m_mutex;

  /// Signaled on any change.
  std::condition_variable m_changed;

  /// See set_connect_error().
  Error_code m_connect_err_code;

  /// See set_send_error().
  Error_code m_send_err_code;

  /// See connect_attempts().
  size_t m_connect_attempts = 0;

  /// The open connection, if any.
  Fake_message_stream::Wire_ptr m_current;

  /// See wait_sent().
  std::deque<std::string> m_sent;

  /// See closes().
  std::vector<transport::Close_status> m_closes;

  /// See last_credentials().
  std::optional<transport::Credentials> m_last_credentials;

  /// See last_sub_protocol().
  std::string m_last_sub_protocol;
}; // class Fake_server

} // namespace dedbg::test
