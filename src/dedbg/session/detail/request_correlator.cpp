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
#include "dedbg/session/detail/request_correlator.hpp"
#include <boost/make_shared.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/weak_ptr.hpp>
#include <chrono>
#include <limits>

namespace dedbg::session::detail
{

// Implementations.

Request_correlator::Request_correlator(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_token_gen(static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count()))
{
  // Nothing else.
}

token_t Request_correlator::reserve_token()
{
  Lock_guard lock(m_mutex);
  const auto token = next_token_locked();
  m_reserved.insert(token);
  return token;
}

void Request_correlator::release_token(token_t token)
{
  Lock_guard lock(m_mutex);
  m_reserved.erase(token);
}

bool Request_correlator::is_reserved(token_t token) const
{
  Lock_guard lock(m_mutex);
  return m_reserved.find(token) != m_reserved.end();
}

token_t Request_correlator::next_token_locked()
{
  boost::random::uniform_int_distribution<token_t> token_dist(1, std::numeric_limits<token_t>::max());

  token_t token;
  do
  {
    token = token_dist(m_token_gen);
  }
  while ((m_pending.find(token) != m_pending.end()) || (m_reserved.find(token) != m_reserved.end()));
  return token;
}

Pending_request_ptr Request_correlator::register_request(const Cancel_scope_ptr& cancel_scope)
{
  Pending_request_ptr req;
  size_t n_pending;
  {
    Lock_guard lock(m_mutex);
    req = boost::make_shared<Pending_request>(next_token_locked());
    m_pending.emplace(req->token(), req);
    n_pending = m_pending.size();
  }

  FLOW_LOG_TRACE("Correlator [" << this << "]: Registered [" << *req << "]; [" << n_pending << "] outstanding.");

  // Outside our lock: if the scope is already canceled this runs the callback right here.
  boost::weak_ptr<Pending_request> weak_req(req);
  req->set_cancel_registration(cancel_scope->on_cancel([weak_req]()
  {
    const auto live_req = weak_req.lock();
    if (live_req)
    {
      live_req->cancel();
    }
  }));

  return req;
} // Request_correlator::register_request()

void Request_correlator::unregister(const Pending_request_ptr& req)
{
  Lock_guard lock(m_mutex);
  const auto it = m_pending.find(req->token());
  if ((it != m_pending.end()) && (it->second == req))
  {
    m_pending.erase(it);
  }
}

Pending_request_ptr Request_correlator::take(token_t token)
{
  Lock_guard lock(m_mutex);
  const auto it = m_pending.find(token);
  if (it == m_pending.end())
  {
    return Pending_request_ptr();
  }
  // else
  auto req = std::move(it->second);
  m_pending.erase(it);
  return req;
}

size_t Request_correlator::pending_count() const
{
  Lock_guard lock(m_mutex);
  return m_pending.size();
}

} // namespace dedbg::session::detail
