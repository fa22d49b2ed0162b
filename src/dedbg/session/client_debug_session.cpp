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
#include "dedbg/session/client_debug_session.hpp"
#include "dedbg/session/detail/client_debug_session_impl.hpp"
#include "dedbg/session/error.hpp"
#include "dedbg/session/remote_fault.hpp"
#include <flow/error/error.hpp>
#include <ostream>

namespace dedbg::session
{

// Implementations.

Client_debug_session::Client_debug_session(flow::log::Logger* logger_ptr, const Session_config& config,
                                           Session_observer* observer_or_null,
                                           Credential_provider* credential_provider_or_null,
                                           transport::Message_stream_factory* stream_factory_or_null) :
  m_impl(new detail::Client_debug_session_impl(logger_ptr, config, observer_or_null, credential_provider_or_null,
                                               stream_factory_or_null))
{
  // Yay.
}

Client_debug_session::~Client_debug_session() = default;

std::string Client_debug_session::use(util::String_view node_path, const Cancel_scope_ptr& cancel_scope,
                                      Error_code* err_code)
{
  Error_code send_err_code;
  const auto reply = m_impl->sync_request(make_use_envelope(node_path), cancel_scope, &send_err_code);

  if ((!send_err_code) && (reply.outcome() == Reply::Outcome::S_REMOTE_FAULT))
  {
    // The server may have left the old node already; assume nothing but the root.
    m_impl->set_current_use_path("/");
  }
  if (!unwrap(reply, send_err_code, err_code, "Client_debug_session::use()"))
  {
    return std::string();
  }
  // else

  const auto use_path = attribute(root_element(reply.document()), "node").value_or("/");
  m_impl->set_current_use_path(use_path);
  return use_path;
}

Client_value::Table Client_debug_session::execute(util::String_view command, const Cancel_scope_ptr& cancel_scope,
                                                  Error_code* err_code)
{
  Error_code send_err_code;
  const auto reply = m_impl->sync_request(make_execute_envelope(command), cancel_scope, &send_err_code);
  if (!unwrap(reply, send_err_code, err_code, "Client_debug_session::execute()"))
  {
    return Client_value::Table();
  }
  // else
  return parse_return(m_impl->get_logger(), root_element(reply.document()));
}

Client_value::Table Client_debug_session::list_members(const Cancel_scope_ptr& cancel_scope, Error_code* err_code)
{
  Error_code send_err_code;
  const auto reply = m_impl->sync_request(make_member_envelope(), cancel_scope, &send_err_code);
  if (!unwrap(reply, send_err_code, err_code, "Client_debug_session::list_members()"))
  {
    return Client_value::Table();
  }
  // else
  return parse_return(m_impl->get_logger(), root_element(reply.document()));
}

Document Client_debug_session::list(bool recursive, const Cancel_scope_ptr& cancel_scope, Error_code* err_code)
{
  Error_code send_err_code;
  const auto reply = m_impl->sync_request(make_list_envelope(recursive), cancel_scope, &send_err_code);
  if (!unwrap(reply, send_err_code, err_code, "Client_debug_session::list()"))
  {
    return Document();
  }
  // else
  return reply.document();
}

Reply Client_debug_session::sync_request(Document&& envelope, const Cancel_scope_ptr& cancel_scope,
                                         Error_code* err_code)
{
  return m_impl->sync_request(std::move(envelope), cancel_scope, err_code);
}

bool Client_debug_session::unwrap(const Reply& reply, const Error_code& send_err_code, Error_code* err_code,
                                  util::String_view context)
{
  Error_code our_err_code = send_err_code;
  if (!our_err_code)
  {
    switch (reply.outcome())
    {
    case Reply::Outcome::S_REPLY:
      break;
    case Reply::Outcome::S_CANCELED:
      our_err_code = error::Code::S_REQUEST_CANCELED;
      break;
    case Reply::Outcome::S_REMOTE_FAULT:
      if (!err_code)
      {
        throw *(reply.fault());
      }
      // else
      our_err_code = error::Code::S_REMOTE_FAULT;
    }
  }

  if (our_err_code)
  {
    if (!err_code)
    {
      throw flow::error::Runtime_error(our_err_code, context);
    }
    // else
    *err_code = our_err_code;
    return false;
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  return true;
} // Client_debug_session::unwrap()

std::string Client_debug_session::current_use_path() const
{
  return m_impl->current_use_path();
}

bool Client_debug_session::is_connected() const
{
  return m_impl->is_connected();
}

size_t Client_debug_session::pending_request_count() const
{
  return m_impl->pending_request_count();
}

util::Timeout Client_debug_session::default_timeout() const
{
  return m_impl->default_timeout();
}

void Client_debug_session::set_default_timeout(util::Timeout timeout)
{
  m_impl->set_default_timeout(timeout);
}

const transport::Endpoint& Client_debug_session::endpoint() const
{
  return m_impl->endpoint();
}

std::ostream& operator<<(std::ostream& os, const Client_debug_session& val)
{
  return os << *val.m_impl;
}

} // namespace dedbg::session
