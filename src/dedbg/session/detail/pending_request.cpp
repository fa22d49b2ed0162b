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
#include "dedbg/session/detail/pending_request.hpp"
#include <cassert>
#include <ostream>

namespace dedbg::session::detail
{

// Implementations.

Pending_request::Pending_request(token_t token) :
  m_token(token),
  m_done(false),
  m_done_future(m_done_promise.get_future().share())
{
  // Nothing else.
}

token_t Pending_request::token() const
{
  return m_token;
}

bool Pending_request::resolve(Reply&& reply)
{
  return complete(std::move(reply), Error_code());
}

bool Pending_request::cancel()
{
  return complete(Reply(), Error_code());
}

bool Pending_request::fail(const Error_code& err_code)
{
  assert(err_code);
  return complete(Reply(), err_code);
}

Error_code Pending_request::send_error() const
{
  Lock_guard lock(m_mutex);
  return m_send_err_code;
}

bool Pending_request::complete(Reply&& reply, const Error_code& send_err_code)
{
  // Released at return, outside our lock: releasing locks the scope's mutex.
  Cancel_scope::Registration cancel_registration;
  {
    Lock_guard lock(m_mutex);
    if (m_done)
    {
      return false;
    }
    // else
    m_reply.emplace(std::move(reply));
    m_send_err_code = send_err_code;
    m_done = true;
    cancel_registration = std::move(m_cancel_registration);
  }

  m_done_promise.set_value();
  return true;
}

bool Pending_request::done() const
{
  Lock_guard lock(m_mutex);
  return m_done;
}

const Reply& Pending_request::wait() const
{
  m_done_future.wait();
  // m_reply is no longer written once m_done; the future's synchronization makes the write visible.
  return *m_reply;
}

void Pending_request::set_cancel_registration(Cancel_scope::Registration&& cancel_registration)
{
  {
    Lock_guard lock(m_mutex);
    if (!m_done)
    {
      m_cancel_registration = std::move(cancel_registration);
      return;
    }
  }
  // else: Already complete; cancel_registration is released on return.
}

std::ostream& operator<<(std::ostream& os, const Pending_request& val)
{
  return os << "req[token=" << val.token() << "]@" << static_cast<const void*>(&val);
}

} // namespace dedbg::session::detail
