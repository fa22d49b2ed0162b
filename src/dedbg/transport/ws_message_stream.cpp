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
#include "dedbg/transport/ws_message_stream.hpp"
#include "dedbg/transport/error.hpp"
#include <openssl/err.h>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/make_shared.hpp>
#include <atomic>
#include <cassert>
#include <deque>
#include <ostream>
#include <utility>

namespace dedbg::transport
{

namespace
{

/**
 * File-local helper: base64-encodes the given bytes, with `=` padding (RFC 4648).
 *
 * @param raw
 *        Bytes.
 * @return See above.
 */
std::string base64_encode(const std::string& raw)
{
  using boost::archive::iterators::base64_from_binary;
  using boost::archive::iterators::transform_width;
  using Base64_iterator = base64_from_binary<transform_width<std::string::const_iterator, 6, 8>>;

  std::string encoded(Base64_iterator(raw.begin()), Base64_iterator(raw.end()));
  encoded.append((3 - (raw.size() % 3)) % 3, '=');
  return encoded;
}

} // namespace (anon)

// Types.

/**
 * The guts of Ws_message_stream.  Each boost.beast completion handler holds a `shared_ptr` to `*this`; so the
 * layers of the WebSocket stream live until the last such handler has executed, even if the Ws_message_stream
 * is gone by then.  All members are accessed in thread W only, except #m_open.
 */
class Ws_message_stream::Link :
  public flow::log::Log_context,
  public boost::enable_shared_from_this<Link>
{
public:
  // Types.

  /// WebSocket over plain TCP.
  using Plain_ws = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  /// WebSocket over TLS over TCP.
  using Tls_ws = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

  /// Completion handler type of async_read_some().
  using Read_handler = Function<void (const Error_code& err_code, size_t n_rcvd, const Frame_info& frame_info)>;

  // Constructors/destructor.

  /**
   * See Ws_message_stream ctor.
   *
   * @param logger_ptr
   *        See Ws_message_stream ctor.
   * @param task_engine
   *        See Ws_message_stream ctor.
   * @param ssl_ctx
   *        See Ws_message_stream ctor.
   * @param connect_timeout
   *        See Ws_message_stream ctor.
   */
  explicit Link(flow::log::Logger* logger_ptr, flow::util::Task_engine* task_engine,
                boost::asio::ssl::context* ssl_ctx, util::Timeout connect_timeout);

  // Methods.

  /**
   * See Ws_message_stream::async_connect().
   *
   * @param endpoint
   *        See above.
   * @param credentials_or_none
   *        See above.
   * @param sub_protocol
   *        See above.
   * @param on_done_func
   *        See above.
   */
  void async_connect(const Endpoint& endpoint, const std::optional<Credentials>& credentials_or_none,
                     util::String_view sub_protocol, flow::async::Task_asio_err&& on_done_func);

  /**
   * See Ws_message_stream::async_read_some().
   *
   * @param target
   *        See above.
   * @param on_done_func
   *        See above.
   */
  void async_read_some(boost::asio::mutable_buffer target, Read_handler&& on_done_func);

  /**
   * See Ws_message_stream::async_send().
   *
   * @param text_msg
   *        See above.
   * @param on_done_func
   *        See above.
   */
  void async_send(std::string&& text_msg, flow::async::Task_asio_err&& on_done_func);

  /**
   * See Ws_message_stream::async_close().
   *
   * @param status
   *        See above.
   * @param reason
   *        See above.
   * @param on_done_func
   *        See above.
   */
  void async_close(Close_status status, util::String_view reason, flow::async::Task_asio_err&& on_done_func);

  /// See Ws_message_stream::cancel().
  void cancel();

  // Data.

  /// See Ws_message_stream::is_open().
  std::atomic<bool> m_open;

  /// Endpoint given to async_connect(); default-constructed until then.
  Endpoint m_endpoint;

private:
  // Methods.

  /**
   * Invokes `task(ws)`, where `ws` is whichever of #m_tls_ws or #m_plain_ws is in use; no-op if neither is yet.
   *
   * @tparam Task
   *         Generic function object taking `Plain_ws&` or `Tls_ws&`.
   * @param task
   *        See above.
   */
  template<typename Task>
  void on_ws(const Task& task);

  /**
   * Completion handler of TCP connect.
   *
   * @param err_code
   *        Result.
   */
  void on_tcp_connected(const Error_code& err_code);

  /// Sets options on the WebSocket and begins its handshake.
  void start_ws_handshake();

  /**
   * Completion handler of the WebSocket handshake; checks the sub-protocol the server selected.
   *
   * @param err_code
   *        Result.
   */
  void on_ws_handshake_done(const Error_code& err_code);

  /**
   * Completes the async_connect() operation by invoking its handler.
   *
   * @param err_code
   *        Result.
   */
  void connect_done(const Error_code& err_code);

  /// Starts the boost.beast write of `m_send_queue.front()`.
  void send_front();

  /**
   * Completion handler of a boost.beast write.
   *
   * @param err_code
   *        Result.
   */
  void on_sent(const Error_code& err_code);

  /**
   * Posts `on_done_func(S_STREAM_NOT_OPEN)`; used when an operation is attempted on a non-open stream.
   *
   * @param on_done_func
   *        Handler.
   */
  void post_not_open(flow::async::Task_asio_err&& on_done_func);

  // Friends.

  /**
   * Prints string representation of the given Link to the given `ostream`.
   *
   * @param os
   *        Stream to which to write.
   * @param val
   *        Object to serialize.
   * @return `os`.
   */
  friend std::ostream& operator<<(std::ostream& os, const Link& val)
  {
    return os << '[' << val.m_endpoint << "]@" << static_cast<const void*>(&val);
  }

  // Data.

  /// See ctor.
  flow::util::Task_engine* const m_task_engine;

  /// See ctor.
  boost::asio::ssl::context* const m_ssl_ctx;

  /// See ctor.
  const util::Timeout m_connect_timeout;

  /// Resolves #m_endpoint host.
  boost::asio::ip::tcp::resolver m_resolver;

  /// The stream if #m_endpoint is `ws`; else empty.
  std::optional<Plain_ws> m_plain_ws;

  /// The stream if #m_endpoint is `wss`; else empty.
  std::optional<Tls_ws> m_tls_ws;

  /// Host header value sent in the handshake request.
  std::string m_host_header;

  /// Sub-protocol offered in the handshake request and expected in the response.
  std::string m_sub_protocol;

  /// `Authorization` header value; empty if no credentials.
  std::string m_authorization;

  /// Filled by the WebSocket handshake.
  boost::beast::websocket::response_type m_handshake_rsp;

  /// async_connect() handler, until it is invoked.
  flow::async::Task_asio_err m_on_connect_done_func;

  /// Messages not yet fully written with their completion handlers; front one is being written if not empty.
  std::deque<std::pair<std::string, flow::async::Task_asio_err>> m_send_queue;
}; // class Ws_message_stream::Link

// Ws_message_stream::Link implementations.

Ws_message_stream::Link::Link(flow::log::Logger* logger_ptr, flow::util::Task_engine* task_engine,
                              boost::asio::ssl::context* ssl_ctx, util::Timeout connect_timeout) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_open(false),
  m_task_engine(task_engine),
  m_ssl_ctx(ssl_ctx),
  m_connect_timeout(connect_timeout),
  m_resolver(*m_task_engine)
{
  // Nothing else.
}

template<typename Task>
void Ws_message_stream::Link::on_ws(const Task& task)
{
  if (m_tls_ws)
  {
    task(*m_tls_ws);
  }
  else if (m_plain_ws)
  {
    task(*m_plain_ws);
  }
}

void Ws_message_stream::Link::async_connect(const Endpoint& endpoint,
                                            const std::optional<Credentials>& credentials_or_none,
                                            util::String_view sub_protocol,
                                            flow::async::Task_asio_err&& on_done_func)
{
  using boost::asio::ip::tcp;

  // We are in thread W.

  assert((!m_plain_ws) && (!m_tls_ws) && "async_connect() may be called at most once.");

  m_endpoint = endpoint;
  m_host_header = m_endpoint.host_header();
  m_sub_protocol = std::string(sub_protocol);
  if (credentials_or_none)
  {
    m_authorization = "Basic "
                      + base64_encode(credentials_or_none->m_user_name + ':' + credentials_or_none->m_password);
  }
  m_on_connect_done_func = std::move(on_done_func);

  if (m_endpoint.tls())
  {
    m_tls_ws.emplace(*m_task_engine, *m_ssl_ctx);
  }
  else
  {
    m_plain_ws.emplace(*m_task_engine);
  }

  FLOW_LOG_INFO("Ws_stream [" << *this << "]: Connecting (sub-protocol [" << m_sub_protocol << "], "
                "credentials supplied? = [" << (!m_authorization.empty()) << "]).");

  m_resolver.async_resolve(m_endpoint.m_host, std::to_string(m_endpoint.m_port),
                           [this, link = shared_from_this()]
                             (const Error_code& err_code, const tcp::resolver::results_type& results)
  {
    // We are in thread W.
    if (err_code)
    {
      connect_done(err_code);
      return;
    }
    // else

    FLOW_LOG_TRACE("Ws_stream [" << *this << "]: Resolved to [" << results.size() << "] address(es); "
                   "TCP-connecting with timeout [" << m_connect_timeout.count() << " ms].");
    on_ws([&](auto& ws)
    {
      auto& tcp_stream = boost::beast::get_lowest_layer(ws);
      tcp_stream.expires_after(m_connect_timeout);
      tcp_stream.async_connect(results, [this, link](const Error_code& err_code, const tcp::endpoint&)
      {
        on_tcp_connected(err_code);
      });
    });
  }); // m_resolver.async_resolve()
} // Ws_message_stream::Link::async_connect()

void Ws_message_stream::Link::on_tcp_connected(const Error_code& err_code)
{
  namespace ssl = boost::asio::ssl;

  // We are in thread W.

  if (err_code)
  {
    connect_done(err_code);
    return;
  }
  // else

  if (!m_tls_ws)
  {
    start_ws_handshake();
    return;
  }
  // else TLS first.

  auto& ssl_stream = m_tls_ws->next_layer();
  if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), m_endpoint.m_host.c_str()))
  {
    connect_done(Error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()));
    return;
  }
  // else
  ssl_stream.set_verify_callback(ssl::host_name_verification(m_endpoint.m_host));

  FLOW_LOG_TRACE("Ws_stream [" << *this << "]: TCP connected; TLS handshake starting.");
  ssl_stream.async_handshake(ssl::stream_base::client, [this, link = shared_from_this()](const Error_code& err_code)
  {
    if (err_code)
    {
      connect_done(err_code);
      return;
    }
    // else
    start_ws_handshake();
  });
} // Ws_message_stream::Link::on_tcp_connected()

void Ws_message_stream::Link::start_ws_handshake()
{
  namespace beast = boost::beast;
  namespace websocket = boost::beast::websocket;
  using beast::http::field;

  // We are in thread W.

  FLOW_LOG_TRACE("Ws_stream [" << *this << "]: WebSocket handshake starting.");

  on_ws([&](auto& ws)
  {
    // The handshake has its own timeout (below); the TCP-level one is no longer wanted.
    beast::get_lowest_layer(ws).expires_never();

    auto timeout_opts = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeout_opts.handshake_timeout = m_connect_timeout;
    ws.set_option(timeout_opts);

    ws.set_option(websocket::stream_base::decorator
                    ([sub_protocol = m_sub_protocol, authorization = m_authorization]
                       (websocket::request_type& req)
    {
      req.set(field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " dedbg-client");
      req.set(field::sec_websocket_protocol, sub_protocol);
      if (!authorization.empty())
      {
        req.set(field::authorization, authorization);
      }
    }));

    ws.async_handshake(m_handshake_rsp, m_host_header, m_endpoint.m_target,
                       [this, link = shared_from_this()](const Error_code& err_code)
    {
      on_ws_handshake_done(err_code);
    });
  }); // on_ws()
} // Ws_message_stream::Link::start_ws_handshake()

void Ws_message_stream::Link::on_ws_handshake_done(const Error_code& err_code)
{
  using boost::beast::http::field;

  // We are in thread W.

  if (err_code)
  {
    connect_done(err_code);
    return;
  }
  // else

  const auto selected_view = m_handshake_rsp[field::sec_websocket_protocol];
  const std::string selected(selected_view.data(), selected_view.size());
  if (selected != m_sub_protocol)
  {
    FLOW_LOG_WARNING("Ws_stream [" << *this << "]: Server completed the WebSocket handshake but selected "
                     "sub-protocol [" << selected << "] instead of [" << m_sub_protocol << "].  Dropping.");
    on_ws([&](auto& ws) { boost::beast::get_lowest_layer(ws).close(); });
    connect_done(error::Code::S_SUB_PROTOCOL_REJECTED);
    return;
  }
  // else

  m_open = true;
  FLOW_LOG_INFO("Ws_stream [" << *this << "]: Open.");
  connect_done(Error_code());
} // Ws_message_stream::Link::on_ws_handshake_done()

void Ws_message_stream::Link::connect_done(const Error_code& err_code)
{
  // We are in thread W.

  if (err_code)
  {
    FLOW_LOG_TRACE("Ws_stream [" << *this << "]: Connect failed: [" << err_code << "] [" << err_code.message() << "].");
  }

  auto on_done_func = std::move(m_on_connect_done_func);
  m_on_connect_done_func = flow::async::Task_asio_err();
  on_done_func(err_code);
}

void Ws_message_stream::Link::async_read_some(boost::asio::mutable_buffer target, Read_handler&& on_done_func)
{
  // We are in thread W.

  if (!m_open)
  {
    boost::asio::post(*m_task_engine, [on_done_func = std::move(on_done_func)]()
    {
      on_done_func(error::Code::S_STREAM_NOT_OPEN, 0, Frame_info());
    });
    return;
  }
  // else

  on_ws([&](auto& ws)
  {
    ws.async_read_some(target, [this, link = shared_from_this(), ws_ptr = &ws,
                                on_done_func = std::move(on_done_func)]
                                 (const Error_code& err_code, size_t n_rcvd)
    {
      // We are in thread W.
      Frame_info frame_info;
      if (err_code)
      {
        m_open = false;
      }
      else
      {
        frame_info.m_text = ws_ptr->got_text();
        frame_info.m_end_of_message = ws_ptr->is_message_done();
      }
      FLOW_LOG_TRACE("Ws_stream [" << *this << "]: Read [" << n_rcvd << "] bytes; "
                     "text? = [" << frame_info.m_text << "]; end-of-message? = [" << frame_info.m_end_of_message << "]; "
                     "result [" << err_code << "].");
      on_done_func(err_code, n_rcvd, frame_info);
    });
  });
} // Ws_message_stream::Link::async_read_some()

void Ws_message_stream::Link::async_send(std::string&& text_msg, flow::async::Task_asio_err&& on_done_func)
{
  // We are in thread W.

  if (!m_open)
  {
    post_not_open(std::move(on_done_func));
    return;
  }
  // else

  m_send_queue.emplace_back(std::move(text_msg), std::move(on_done_func));
  if (m_send_queue.size() == 1)
  {
    send_front();
  }
  // else on_sent() will get to it.
}

void Ws_message_stream::Link::send_front()
{
  // We are in thread W.

  on_ws([&](auto& ws)
  {
    ws.text(true);
    ws.async_write(boost::asio::buffer(m_send_queue.front().first),
                   [this, link = shared_from_this()](const Error_code& err_code, size_t)
    {
      on_sent(err_code);
    });
  });
}

void Ws_message_stream::Link::on_sent(const Error_code& err_code)
{
  // We are in thread W.

  auto on_done_func = std::move(m_send_queue.front().second);
  m_send_queue.pop_front();

  if (err_code)
  {
    FLOW_LOG_WARNING("Ws_stream [" << *this << "]: Write failed: [" << err_code << "] [" << err_code.message() << "]; "
                     "failing the [" << m_send_queue.size() << "] queued message(s) behind it too.");
    m_open = false;
    auto queue = std::move(m_send_queue);
    m_send_queue.clear();

    on_done_func(err_code);
    for (auto& queued : queue)
    {
      queued.second(err_code);
    }
    return;
  }
  // else

  // Start the next one before the handler, which may itself async_send().
  if (!m_send_queue.empty())
  {
    send_front();
  }
  on_done_func(err_code);
} // Ws_message_stream::Link::on_sent()

void Ws_message_stream::Link::async_close(Close_status status, util::String_view reason,
                                          flow::async::Task_asio_err&& on_done_func)
{
  namespace websocket = boost::beast::websocket;

  // We are in thread W.

  if (!m_open)
  {
    post_not_open(std::move(on_done_func));
    return;
  }
  // else

  m_open = false;
  const websocket::close_reason close_reason((status == Close_status::S_NORMAL)
                                               ? websocket::close_code::normal : websocket::close_code::too_big,
                                             boost::beast::string_view(reason.data(), reason.size()));
  FLOW_LOG_INFO("Ws_stream [" << *this << "]: Closing with code [" << close_reason.code << "], "
                "reason [" << reason << "].");

  on_ws([&](auto& ws)
  {
    ws.async_close(close_reason, [link = shared_from_this(), on_done_func = std::move(on_done_func)]
                                   (const Error_code& err_code)
    {
      on_done_func(err_code);
    });
  });
} // Ws_message_stream::Link::async_close()

void Ws_message_stream::Link::cancel()
{
  // We are in thread W.

  m_open = false;
  m_resolver.cancel();
  on_ws([&](auto& ws) { boost::beast::get_lowest_layer(ws).close(); });
}

void Ws_message_stream::Link::post_not_open(flow::async::Task_asio_err&& on_done_func)
{
  boost::asio::post(*m_task_engine, [on_done_func = std::move(on_done_func)]()
  {
    on_done_func(error::Code::S_STREAM_NOT_OPEN);
  });
}

// Ws_message_stream implementations.

Ws_message_stream::Ws_message_stream(flow::log::Logger* logger_ptr, flow::util::Task_engine* task_engine,
                                     boost::asio::ssl::context* ssl_ctx, util::Timeout connect_timeout) :
  m_link(boost::make_shared<Link>(logger_ptr, task_engine, ssl_ctx, connect_timeout))
{
  // Nothing else.
}

Ws_message_stream::~Ws_message_stream()
{
  m_link->cancel();
}

void Ws_message_stream::async_connect(const Endpoint& endpoint, const std::optional<Credentials>& credentials_or_none,
                                      util::String_view sub_protocol, flow::async::Task_asio_err&& on_done_func)
{
  m_link->async_connect(endpoint, credentials_or_none, sub_protocol, std::move(on_done_func));
}

void Ws_message_stream::async_read_some(boost::asio::mutable_buffer target,
                                        Function<void (const Error_code& err_code, size_t n_rcvd,
                                                       const Frame_info& frame_info)>&& on_done_func)
{
  m_link->async_read_some(target, std::move(on_done_func));
}

void Ws_message_stream::async_send(std::string&& text_msg, flow::async::Task_asio_err&& on_done_func)
{
  m_link->async_send(std::move(text_msg), std::move(on_done_func));
}

void Ws_message_stream::async_close(Close_status status, util::String_view reason,
                                    flow::async::Task_asio_err&& on_done_func)
{
  m_link->async_close(status, reason, std::move(on_done_func));
}

void Ws_message_stream::cancel()
{
  m_link->cancel();
}

bool Ws_message_stream::is_open() const
{
  return m_link->m_open;
}

std::ostream& operator<<(std::ostream& os, const Ws_message_stream& val)
{
  return os << '[' << val.m_link->m_endpoint << "]@" << static_cast<const void*>(&val);
}

// Ws_message_stream_factory implementations.

Ws_message_stream_factory::Ws_message_stream_factory(util::Timeout connect_timeout, bool verify_tls_peer) :
  m_connect_timeout(connect_timeout),
  m_ssl_ctx(boost::asio::ssl::context::tls_client)
{
  namespace ssl = boost::asio::ssl;

  if (verify_tls_peer)
  {
    m_ssl_ctx.set_default_verify_paths(); // Throws on failure.
    m_ssl_ctx.set_verify_mode(ssl::verify_peer);
  }
  else
  {
    m_ssl_ctx.set_verify_mode(ssl::verify_none);
  }
}

std::unique_ptr<Message_stream> Ws_message_stream_factory::create_stream(flow::log::Logger* logger_ptr,
                                                                         flow::util::Task_engine* task_engine)
{
  return std::make_unique<Ws_message_stream>(logger_ptr, task_engine, &m_ssl_ctx, m_connect_timeout);
}

} // namespace dedbg::transport
