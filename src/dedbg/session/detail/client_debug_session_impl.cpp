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
#include "dedbg/session/detail/client_debug_session_impl.hpp"
#include "dedbg/session/error.hpp"
#include "dedbg/transport/ws_message_stream.hpp"
#include <flow/error/error.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/make_shared.hpp>
#include <boost/thread/future.hpp>
#include <algorithm>
#include <cassert>
#include <ostream>

namespace dedbg::session::detail
{

namespace
{

/**
 * File-local helper: the default stream factory, unless the user supplied one.
 *
 * @param config
 *        Session config.
 * @param stream_factory_or_null
 *        See Client_debug_session_impl ctor.
 * @return Null if `stream_factory_or_null` is not null; else a new factory.
 */
boost::movelib::unique_ptr<transport::Message_stream_factory>
  make_own_stream_factory(const Session_config& config, transport::Message_stream_factory* stream_factory_or_null)
{
  if (stream_factory_or_null)
  {
    return boost::movelib::unique_ptr<transport::Message_stream_factory>();
  }
  // else
  return boost::movelib::unique_ptr<transport::Message_stream_factory>
           (new transport::Ws_message_stream_factory(config.m_connect_timeout, config.m_verify_tls_peer));
}

/**
 * File-local helper: returns the given config, if it is usable.
 *
 * @param config
 *        Session config.
 * @return `config`.
 * @throws flow::error::Runtime_error
 *         error::Code::S_INVALID_CONFIG.
 */
const Session_config& checked_config(const Session_config& config)
{
  if (config.m_recv_buffer_size == 0)
  {
    throw flow::error::Runtime_error(error::Code::S_INVALID_CONFIG, "Client_debug_session_impl ctor");
  }
  // else
  return config;
}

} // namespace (anon)

// Implementations.

Client_debug_session_impl::Client_debug_session_impl(flow::log::Logger* logger_ptr, const Session_config& config,
                                                     Session_observer* observer_or_null,
                                                     Credential_provider* credential_provider_or_null,
                                                     transport::Message_stream_factory* stream_factory_or_null) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_config(checked_config(config)), // Throws on error.
  m_endpoint(transport::parse_server_uri(m_config.m_server_uri)), // Throws on error.
  m_observer(observer_or_null ? observer_or_null : &m_default_observer),
  m_credential_provider(credential_provider_or_null ? credential_provider_or_null
                                                    : &m_default_credential_provider),
  m_own_stream_factory(make_own_stream_factory(m_config, stream_factory_or_null)),
  m_stream_factory(stream_factory_or_null ? stream_factory_or_null : m_own_stream_factory.get()),
  m_disposing(false),
  m_default_timeout_ms(std::max(m_config.m_default_timeout, util::Timeout::zero()).count()),
  m_correlator(get_logger()),
  m_session_scope(Cancel_scope::create()),
  m_async_worker(get_logger(), flow::util::ostream_op_string("dbg_sess[", m_endpoint, ']')),
  m_reconnect_timer(*(m_async_worker.task_engine())),
  m_recv_buf(m_config.m_recv_buffer_size),
  m_recv_size(0),
  m_use_token(0)
{
  FLOW_LOG_INFO("Debug session [" << *this << "]: Created with config " << m_config << ".  "
                "Worker thread starting; will begin connecting immediately.");

  m_async_worker.start();
  m_async_worker.post([this]() { start_connecting(); });
}

Client_debug_session_impl::~Client_debug_session_impl()
{
  using flow::async::Synchronicity;
  using boost::promise;

  // We are in thread U.  By contract in doc header, they must not call us from a hook (thread W).
  assert((!m_async_worker.in_thread()) && "Do not destroy the session from an observer hook.");

  FLOW_LOG_INFO("Debug session [" << *this << "]: Shutting down.  Will close the connection gracefully, if any "
                "(for up to [" << m_config.m_close_timeout.count() << " ms]); cancel all outstanding requests; "
                "then stop the worker thread.");

  m_disposing = true;

  /* Graceful close.  We cannot wait for it in thread W (its completion runs there), so we wait here, with a
   * timeout in case the server does not cooperate. */
  const auto closed_promise = boost::make_shared<promise<void>>();
  auto closed_future = closed_promise->get_future();
  m_async_worker.post([this, closed_promise]()
  {
    // We are in thread W.
    if ((!m_stream) || (!m_stream->is_open()))
    {
      closed_promise->set_value();
      return;
    }
    // else
    m_stream->async_close(transport::Close_status::S_NORMAL, "Done", [this, closed_promise](const Error_code& err_code)
    {
      FLOW_LOG_TRACE("Debug session [" << *this << "]: Graceful close finished with [" << err_code << "].");
      closed_promise->set_value();
    });
  });
  if (closed_future.wait_for(boost::chrono::milliseconds(m_config.m_close_timeout.count()))
        != boost::future_status::ready)
  {
    FLOW_LOG_INFO("Debug session [" << *this << "]: Graceful close did not finish in time; aborting it.");
  }

  // This cancels every Connection scope and hence every request still waiting.
  m_session_scope->cancel();

  m_async_worker.post([this]()
  {
    // We are in thread W.
    m_reconnect_timer.cancel();
    if (m_stream)
    {
      m_stream->cancel();
      m_stream.reset();
    }
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  /* This (1) stop()s the Task_engine thus possibly preventing any more handlers from running at all (any handler
   * possibly running now is the last one to run); (2) at that point Task_engine::run() exits, hence thread W exits;
   * (3) joins thread W (waits for it to exit); (4) returns. */
  m_async_worker.stop();
  // Thread W is (synchronously!) no more.  No hook can run from now on.

  FLOW_LOG_INFO("Debug session [" << *this << "]: Shut down.  [" << m_correlator.pending_count() << "] request(s) "
                "were still registered (all canceled).");
} // Client_debug_session_impl::~Client_debug_session_impl()

void Client_debug_session_impl::start_connecting()
{
  // We are in thread W.

  if (m_disposing)
  {
    return;
  }
  // else

  assert(!m_stream);

  const auto credentials_or_none = m_credential_provider->credentials(m_endpoint);

  FLOW_LOG_TRACE("Debug session [" << *this << "]: Connecting.");
  m_stream = m_stream_factory->create_stream(get_logger(), m_async_worker.task_engine());
  m_stream->async_connect(m_endpoint, credentials_or_none, Session_config::S_SUB_PROTOCOL,
                          [this](const Error_code& err_code)
  {
    on_connect_done(err_code);
  });
}

void Client_debug_session_impl::on_connect_done(const Error_code& err_code)
{
  // We are in thread W.

  if (m_disposing)
  {
    return;
  }
  // else

  if (err_code)
  {
    m_stream.reset();

    if (err_code == m_last_failure)
    {
      FLOW_LOG_TRACE("Debug session [" << *this << "]: Connect attempt failed again with [" << err_code << "]; "
                     "not reporting the repeat.");
    }
    else
    {
      FLOW_LOG_WARNING("Debug session [" << *this << "]: Connect attempt failed: "
                       "[" << err_code << "] [" << err_code.message() << "].  Will retry in "
                       "[" << m_config.m_reconnect_delay.count() << " ms].");
      if (m_observer->on_connection_failure(err_code))
      {
        m_last_failure.clear(); // They want to hear about it again.
      }
      else
      {
        m_last_failure = err_code;
      }
    }

    schedule_reconnect();
    return;
  }
  // else: Open.

  auto conn = boost::make_shared<Connection>();
  conn->m_scope = Cancel_scope::create_child(m_session_scope);
  m_conn_w = conn;
  {
    Lock_guard conn_lock(m_conn_mutex);
    m_conn = std::move(conn);
  }

  FLOW_LOG_INFO("Debug session [" << *this << "]: Connection established.");
  m_observer->on_connection_established();

  restore_use_path();

  m_recv_size = 0;
  read_some();
} // Client_debug_session_impl::on_connect_done()

void Client_debug_session_impl::schedule_reconnect()
{
  // We are in thread W.

  m_reconnect_timer.expires_after(m_config.m_reconnect_delay);
  m_reconnect_timer.async_wait([this](const Error_code& err_code)
  {
    if (err_code) // operation_aborted: shutting down.
    {
      return;
    }
    // else
    start_connecting();
  });
}

void Client_debug_session_impl::restore_use_path()
{
  // We are in thread W.

  const auto use_path = current_use_path();
  if (use_path.empty() || (use_path == "/"))
  {
    set_current_use_path("/");
    return;
  }
  // else

  /* Re-select the node selected on the previous connection.  The reply is consumed by dispatch() (not by a waiting
   * caller); so no Pending_request is registered, only the token reserved; and nothing here waits for it. */
  auto use_envelope = make_use_envelope(use_path);
  m_use_token = m_correlator.reserve_token();
  stamp_token(&use_envelope, m_use_token);

  FLOW_LOG_INFO("Debug session [" << *this << "]: Restoring use path [" << use_path << "] "
                "(token [" << m_use_token << "]).");
  m_stream->async_send(serialize(use_envelope), [this](const Error_code& err_code)
  {
    if (err_code)
    {
      // The read loop will see the same trouble and tear down.
      FLOW_LOG_TRACE("Debug session [" << *this << "]: Use-path-restoring send failed with [" << err_code << "].");
    }
  });
} // Client_debug_session_impl::restore_use_path()

void Client_debug_session_impl::read_some()
{
  // We are in thread W.

  assert(m_recv_size < m_recv_buf.size());
  m_stream->async_read_some(boost::asio::buffer(m_recv_buf.data() + m_recv_size, m_recv_buf.size() - m_recv_size),
                            [this](const Error_code& err_code, size_t n_rcvd,
                                   const transport::Frame_info& frame_info)
  {
    on_read_some(err_code, n_rcvd, frame_info);
  });
}

void Client_debug_session_impl::on_read_some(const Error_code& err_code, size_t n_rcvd,
                                             const transport::Frame_info& frame_info)
{
  using boost::beast::websocket::error::closed;
  using boost::asio::error::operation_aborted;

  // We are in thread W.

  if (err_code)
  {
    if (m_disposing || (err_code == operation_aborted))
    {
      FLOW_LOG_TRACE("Debug session [" << *this << "]: Read aborted ([" << err_code << "]).");
    }
    else if (err_code == closed)
    {
      FLOW_LOG_INFO("Debug session [" << *this << "]: Server closed the connection.");
    }
    else
    {
      report_communication_fault(err_code);
    }
    teardown();
    return;
  }
  // else

  if (!frame_info.m_text)
  {
    // Binary frames carry nothing for us; do not keep the bytes.
    FLOW_LOG_TRACE("Debug session [" << *this << "]: Ignoring [" << n_rcvd << "] bytes of a binary message.");
  }
  else
  {
    m_recv_size += n_rcvd;
    if (frame_info.m_end_of_message)
    {
      const util::String_view text(m_recv_buf.data(), m_recv_size);
      m_recv_size = 0;
      on_message(text); // Does not touch m_recv_buf past this point.
    }
    else if (m_recv_size == m_recv_buf.size())
    {
      FLOW_LOG_WARNING("Debug session [" << *this << "]: Incoming message exceeds receive buffer capacity "
                       "[" << m_recv_buf.size() << "].  Closing connection.");
      m_observer->on_communication_fault(error::Code::S_MESSAGE_TOO_LARGE);
      m_recv_size = 0;
      m_stream->async_close(transport::Close_status::S_MESSAGE_TOO_BIG, "Message too big.",
                            [this](const Error_code& close_err_code)
      {
        FLOW_LOG_TRACE("Debug session [" << *this << "]: Close finished with [" << close_err_code << "].");
        teardown();
      });
      return;
    }
  }

  read_some();
} // Client_debug_session_impl::on_read_some()

void Client_debug_session_impl::on_message(util::String_view text)
{
  // We are in thread W.

  FLOW_LOG_DATA("Debug session [" << *this << "]: Received message [" << text << "].");

  Error_code err_code;
  auto doc = parse_document(text, &err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Debug session [" << *this << "]: Received message of [" << text.size() << "] bytes is "
                     "not a well-formed document; ignoring it.");
    m_last_failure.clear();
    m_observer->on_communication_fault(err_code);
    return;
  }
  // else

  dispatch(std::move(doc));
}

void Client_debug_session_impl::dispatch(Document&& doc)
{
  // We are in thread W.

  const auto token = read_token(doc);
  if (token == 0)
  {
    // Unsolicited notification.  None are defined at this time.
    FLOW_LOG_TRACE("Debug session [" << *this << "]: Received message [" << root_tag(doc) << "] without token; "
                   "ignoring it.");
    return;
  }
  // else

  if ((m_use_token != 0) && (token == m_use_token))
  {
    m_correlator.release_token(m_use_token);
    m_use_token = 0;
    if (root_tag(doc) == S_EXCEPTION_TAG)
    {
      FLOW_LOG_WARNING("Debug session [" << *this << "]: Restoring use path failed remotely "
                       "(" << Remote_fault(root_element(doc)) << "); falling back to root.");
      set_current_use_path("/");
    }
    else
    {
      set_current_use_path(attribute(root_element(doc), "node").value_or("/"));
    }
    return;
  }
  // else

  const auto req = m_correlator.take(token);
  if (!req)
  {
    FLOW_LOG_TRACE("Debug session [" << *this << "]: Received reply [" << root_tag(doc) << "] with token "
                   "[" << token << "] that nobody awaits (canceled?); ignoring it.");
    return;
  }
  // else

  Reply reply(std::move(doc));
  FLOW_LOG_TRACE("Debug session [" << *this << "]: Received [" << reply.outcome() << "] for [" << *req << "].");
  if (!req->resolve(std::move(reply)))
  {
    FLOW_LOG_TRACE("Debug session [" << *this << "]: [" << *req << "] was already canceled; reply dropped.");
  }
} // Client_debug_session_impl::dispatch()

void Client_debug_session_impl::report_communication_fault(const Error_code& err_code)
{
  // We are in thread W.

  if (err_code == m_last_failure)
  {
    FLOW_LOG_TRACE("Debug session [" << *this << "]: Communication failed again with [" << err_code << "]; "
                   "not reporting the repeat.");
    return;
  }
  // else

  FLOW_LOG_WARNING("Debug session [" << *this << "]: Communication failed: "
                   "[" << err_code << "] [" << err_code.message() << "].");
  m_last_failure = err_code;
  m_observer->on_communication_fault(err_code);
}

void Client_debug_session_impl::teardown()
{
  // We are in thread W.

  const bool established = bool(m_conn_w);
  if (established)
  {
    {
      Lock_guard conn_lock(m_conn_mutex);
      m_conn.reset();
    }
    // Every request waiting on this connection is now canceled.
    m_conn_w->m_scope->cancel();
    m_conn_w.reset();
  }
  if (m_use_token != 0)
  {
    m_correlator.release_token(m_use_token);
    m_use_token = 0;
  }
  m_recv_size = 0;

  if (m_stream)
  {
    m_stream->cancel();
    m_stream.reset();
  }

  if (m_disposing)
  {
    return;
  }
  // else

  if (established)
  {
    FLOW_LOG_INFO("Debug session [" << *this << "]: Connection lost.  Reconnecting.");
    m_observer->on_connection_lost();
  }

  start_connecting();
} // Client_debug_session_impl::teardown()

Reply Client_debug_session_impl::sync_request(Document&& envelope, const Cancel_scope_ptr& cancel_scope_or_null,
                                              Error_code* err_code)
{
  Reply reply;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Reply
           { return sync_request(std::move(envelope), cancel_scope_or_null, actual_err_code); },
         &reply, err_code, "Client_debug_session::sync_request()"))
  {
    return reply;
  }
  // else

  // We are in thread U.  By contract they must not call us from a hook (thread W): we would wait forever.
  assert((!m_async_worker.in_thread()) && "Do not send requests from an observer hook.");

  if (m_disposing)
  {
    *err_code = error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER;
    return Reply();
  }
  // else

  Connection_ptr conn;
  {
    Lock_guard conn_lock(m_conn_mutex);
    conn = m_conn;
  }
  if (!conn)
  {
    FLOW_LOG_TRACE("Debug session [" << *this << "]: Request [" << root_tag(envelope) << "] not sent: "
                   "not connected.");
    *err_code = error::Code::S_NOT_CONNECTED;
    return Reply();
  }
  // else

  /* Choose what cancels the wait.  Always the connection going away; plus either the caller's scope, or (absent
   * one) the default timeout if set. */
  Cancel_scope_ptr scope;
  if (cancel_scope_or_null)
  {
    scope = Cancel_scope::create_linked(conn->m_scope, cancel_scope_or_null);
  }
  else
  {
    const auto timeout = default_timeout();
    if (timeout == util::Timeout::zero())
    {
      scope = conn->m_scope;
    }
    else
    {
      scope = Cancel_scope::create_child(conn->m_scope);
      scope->cancel_after(m_async_worker.task_engine(), timeout);
    }
  }

  const auto req = m_correlator.register_request(scope);
  stamp_token(&envelope, req->token());
  auto msg = serialize(envelope);

  FLOW_LOG_TRACE("Debug session [" << *this << "]: Sending [" << root_tag(envelope) << "] as [" << *req << "].");
  FLOW_LOG_DATA("Debug session [" << *this << "]: Sending message [" << msg << "].");

  m_async_worker.post([this, conn = std::move(conn), req, msg = std::move(msg)]() mutable
  {
    // We are in thread W.
    if ((m_conn_w != conn) || (!m_stream))
    {
      req->fail(error::Code::S_NOT_CONNECTED); // Lost it meanwhile.
      return;
    }
    // else
    if (req->done())
    {
      return; // Canceled before it could be sent; do not bother.
    }
    // else
    m_stream->async_send(std::move(msg), [req](const Error_code& send_err_code)
    {
      if (send_err_code)
      {
        req->fail(send_err_code);
      }
    });
  });

  reply = req->wait();
  const auto send_err_code = req->send_error();
  m_correlator.unregister(req); // No-op if dispatch() took it already.

  if (send_err_code)
  {
    FLOW_LOG_WARNING("Debug session [" << *this << "]: [" << *req << "] could not be sent: "
                     "[" << send_err_code << "] [" << send_err_code.message() << "].");
    *err_code = send_err_code;
    return Reply();
  }
  // else

  if (reply.canceled())
  {
    FLOW_LOG_INFO("Debug session [" << *this << "]: [" << *req << "] canceled before its reply arrived.");
  }
  else if (reply.outcome() == Reply::Outcome::S_REMOTE_FAULT)
  {
    FLOW_LOG_WARNING("Debug session [" << *this << "]: [" << *req << "] got remote fault "
                     "(" << *reply.fault() << ").");
  }

  err_code->clear();
  return reply;
} // Client_debug_session_impl::sync_request()

std::string Client_debug_session_impl::current_use_path() const
{
  Lock_guard use_path_lock(m_use_path_mutex);
  return m_use_path;
}

void Client_debug_session_impl::set_current_use_path(const std::string& use_path)
{
  {
    Lock_guard use_path_lock(m_use_path_mutex);
    if (m_use_path == use_path)
    {
      return;
    }
    // else
    m_use_path = use_path;
  }

  FLOW_LOG_INFO("Debug session [" << *this << "]: Use path is now [" << use_path << "].");

  // Hooks run in thread W only; this may be called from thread U.
  m_async_worker.post([this, use_path]()
  {
    if (!m_disposing)
    {
      m_observer->on_current_use_path_changed(use_path);
    }
  });
}

bool Client_debug_session_impl::is_connected() const
{
  Lock_guard conn_lock(m_conn_mutex);
  return bool(m_conn);
}

size_t Client_debug_session_impl::pending_request_count() const
{
  return m_correlator.pending_count();
}

util::Timeout Client_debug_session_impl::default_timeout() const
{
  return util::Timeout(m_default_timeout_ms.load());
}

void Client_debug_session_impl::set_default_timeout(util::Timeout timeout)
{
  m_default_timeout_ms = std::max(timeout, util::Timeout::zero()).count();
}

const transport::Endpoint& Client_debug_session_impl::endpoint() const
{
  return m_endpoint;
}

std::ostream& operator<<(std::ostream& os, const Client_debug_session_impl& val)
{
  return os << '[' << val.m_endpoint << "]@" << static_cast<const void*>(&val);
}

} // namespace dedbg::session::detail
