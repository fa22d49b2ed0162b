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
#include <boost/asio/ssl/context.hpp>
#include <boost/shared_ptr.hpp>
#include <iosfwd>

namespace dedbg::transport
{

// Types.

/**
 * Message_stream implemented as a client WebSocket (RFC 6455) over TCP, optionally secured by TLS (`wss`), using
 * boost.beast.  Connecting means: resolve the host; TCP-connect (bounded by a timeout); TLS-handshake if
 * applicable (with SNI and, if so configured, peer verification); and finally the WebSocket handshake, offering
 * the sub-protocol given to async_connect() and failing with error::Code::S_SUB_PROTOCOL_REJECTED if the server
 * does not select it.  If credentials are supplied they are sent as an HTTP Basic `Authorization` header.
 *
 * Outgoing messages are queued; at most one boost.beast write is outstanding at a time.
 *
 * It is fine to destroy `*this` while operations are outstanding: they are aborted, and their completion handlers
 * still execute (with a truthy `Error_code`), while the internals they touch stay alive until they do.
 *
 * Obtain objects of this type from a Ws_message_stream_factory.
 */
class Ws_message_stream :
  public Message_stream
{
public:
  // Constructors/destructor.

  /**
   * Constructs the stream in not-open state.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param task_engine
   *        See Message_stream_factory::create_stream().
   * @param ssl_ctx
   *        TLS context used if the endpoint is `wss`.  Must outlive `*this`.
   * @param connect_timeout
   *        Upper bound on the TCP connect and TLS handshake stage.
   */
  explicit Ws_message_stream(flow::log::Logger* logger_ptr, flow::util::Task_engine* task_engine,
                             boost::asio::ssl::context* ssl_ctx, util::Timeout connect_timeout);

  /// Aborts any outstanding operations, as if by cancel().
  ~Ws_message_stream() override;

  // Methods.

  /**
   * Implements Message_stream API.
   *
   * @param endpoint
   *        See Message_stream.
   * @param credentials_or_none
   *        See Message_stream.
   * @param sub_protocol
   *        See Message_stream.
   * @param on_done_func
   *        See Message_stream.
   */
  void async_connect(const Endpoint& endpoint, const std::optional<Credentials>& credentials_or_none,
                     util::String_view sub_protocol, flow::async::Task_asio_err&& on_done_func) override;

  /**
   * Implements Message_stream API.
   *
   * @param target
   *        See Message_stream.
   * @param on_done_func
   *        See Message_stream.
   */
  void async_read_some(boost::asio::mutable_buffer target,
                       Function<void (const Error_code& err_code, size_t n_rcvd,
                                      const Frame_info& frame_info)>&& on_done_func) override;

  /**
   * Implements Message_stream API.
   *
   * @param text_msg
   *        See Message_stream.
   * @param on_done_func
   *        See Message_stream.
   */
  void async_send(std::string&& text_msg, flow::async::Task_asio_err&& on_done_func) override;

  /**
   * Implements Message_stream API.
   *
   * @param status
   *        See Message_stream.
   * @param reason
   *        See Message_stream.
   * @param on_done_func
   *        See Message_stream.
   */
  void async_close(Close_status status, util::String_view reason,
                   flow::async::Task_asio_err&& on_done_func) override;

  /// Implements Message_stream API.
  void cancel() override;

  /**
   * Implements Message_stream API.
   * @return See Message_stream.
   */
  bool is_open() const override;

private:
  // Types.

  /// The guts; ref-counted so that outstanding boost.beast handlers can keep them alive past `*this`.
  class Link;

  // Friends.

  // Friend of Ws_message_stream: For access to our internals.
  friend std::ostream& operator<<(std::ostream& os, const Ws_message_stream& val);

  // Data.

  /// See Link.
  boost::shared_ptr<Link> m_link;
}; // class Ws_message_stream

/**
 * The default Message_stream_factory: creates Ws_message_stream objects, all sharing one TLS context owned by
 * `*this`.  Hence `*this` must outlive the streams it creates.
 */
class Ws_message_stream_factory :
  public Message_stream_factory
{
public:
  // Constructors/destructor.

  /**
   * Prepares the TLS context: system default trust store, peer verification on or off.
   *
   * @param connect_timeout
   *        See Ws_message_stream ctor.
   * @param verify_tls_peer
   *        Whether `wss` connections verify the server's certificate chain and host name.
   */
  explicit Ws_message_stream_factory(util::Timeout connect_timeout, bool verify_tls_peer);

  // Methods.

  /**
   * Implements Message_stream_factory API.
   *
   * @param logger_ptr
   *        See Message_stream_factory.
   * @param task_engine
   *        See Message_stream_factory.
   * @return See Message_stream_factory.
   */
  std::unique_ptr<Message_stream> create_stream(flow::log::Logger* logger_ptr,
                                                flow::util::Task_engine* task_engine) override;

private:
  // Data.

  /// See ctor.
  const util::Timeout m_connect_timeout;

  /// TLS context shared by all `wss` streams we create.
  boost::asio::ssl::context m_ssl_ctx;
}; // class Ws_message_stream_factory

// Free functions.

/**
 * Prints string representation of the given Ws_message_stream to the given `ostream`.
 *
 * @relatesalso Ws_message_stream
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Ws_message_stream& val);

} // namespace dedbg::transport
