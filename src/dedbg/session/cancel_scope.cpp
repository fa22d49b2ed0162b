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
#include "dedbg/session/cancel_scope.hpp"
#include <boost/make_shared.hpp>
#include <cassert>
#include <utility>

namespace dedbg::session
{

// Cancel_scope::Registration implementations.

Cancel_scope::Registration::Registration() :
  m_id(0)
{
  // Nothing else.
}

Cancel_scope::Registration::Registration(const Cancel_scope_ptr& scope, uint64_t id) :
  m_scope(scope),
  m_id(id)
{
  // Nothing else.
}

Cancel_scope::Registration::Registration(Registration&& src) :
  m_scope(std::move(src.m_scope)),
  m_id(src.m_id)
{
  src.m_scope.reset();
  src.m_id = 0;
}

Cancel_scope::Registration::~Registration()
{
  release();
}

Cancel_scope::Registration& Cancel_scope::Registration::operator=(Registration&& src)
{
  if (&src != this)
  {
    release();
    m_scope = std::move(src.m_scope);
    m_id = src.m_id;
    src.m_scope.reset();
    src.m_id = 0;
  }
  return *this;
}

void Cancel_scope::Registration::release()
{
  const auto scope = m_scope.lock();
  if (scope)
  {
    scope->deregister(m_id);
  }
  m_scope.reset();
}

// Cancel_scope implementations.

Cancel_scope::Cancel_scope() :
  m_canceled(false),
  m_next_id(1)
{
  // Nothing else.
}

Cancel_scope_ptr Cancel_scope::create()
{
  return Cancel_scope_ptr(new Cancel_scope);
}

Cancel_scope_ptr Cancel_scope::create_child(const Cancel_scope_ptr& parent)
{
  auto scope = create();
  scope->link_to_parent(parent);
  return scope;
}

Cancel_scope_ptr Cancel_scope::create_linked(const Cancel_scope_ptr& parent1, const Cancel_scope_ptr& parent2)
{
  auto scope = create();
  scope->link_to_parent(parent1);
  scope->link_to_parent(parent2);
  return scope;
}

void Cancel_scope::link_to_parent(const Cancel_scope_ptr& parent)
{
  assert(parent);

  /* Capture weakly: the parent's callback table must not keep the child alive.  If the parent is already canceled
   * this cancels us synchronously, which is fine: nobody else has us yet. */
  boost::weak_ptr<Cancel_scope> weak_this(shared_from_this());
  m_parent_registrations.emplace_back(parent->on_cancel([weak_this]()
  {
    const auto child = weak_this.lock();
    if (child)
    {
      child->cancel();
    }
  }));
}

void Cancel_scope::cancel()
{
  std::map<uint64_t, Function<void ()>> callbacks;
  {
    Lock_guard lock(m_mutex);
    if (m_canceled)
    {
      return;
    }
    // else
    m_canceled = true;
    callbacks = std::move(m_callbacks);
    m_callbacks.clear();
  }

  // Invoke outside the lock: a callback may well touch *this (e.g., a Registration being released).
  for (auto& id_and_func : callbacks)
  {
    id_and_func.second();
  }
}

bool Cancel_scope::canceled() const
{
  Lock_guard lock(m_mutex);
  return m_canceled;
}

Cancel_scope::Registration Cancel_scope::on_cancel(Function<void ()>&& on_cancel_func)
{
  uint64_t id;
  {
    Lock_guard lock(m_mutex);
    if (!m_canceled)
    {
      id = m_next_id++;
      m_callbacks.emplace(id, std::move(on_cancel_func));
      return Registration(shared_from_this(), id);
    }
  }
  // else: Already canceled.

  on_cancel_func();
  return Registration();
}

void Cancel_scope::deregister(uint64_t id)
{
  Lock_guard lock(m_mutex);
  m_callbacks.erase(id);
}

void Cancel_scope::cancel_after(flow::util::Task_engine* task_engine, util::Timeout timeout)
{
  assert((!m_timer) && "cancel_after() may be called at most once.");

  m_timer = boost::make_shared<boost::asio::steady_timer>(*task_engine);
  m_timer->expires_after(timeout);

  boost::weak_ptr<Cancel_scope> weak_this(shared_from_this());
  m_timer->async_wait([weak_this](const Error_code& err_code)
  {
    if (err_code) // operation_aborted: *this is gone, so nothing to cancel.
    {
      return;
    }
    // else
    const auto scope = weak_this.lock();
    if (scope)
    {
      scope->cancel();
    }
  });
}

} // namespace dedbg::session
