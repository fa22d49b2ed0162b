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
#include "dedbg/session/reply.hpp"
#include <ostream>

namespace dedbg::session
{

// Implementations.

Reply::Reply() :
  m_outcome(Outcome::S_CANCELED)
{
  // Nothing else.
}

Reply::Reply(Document&& doc) :
  m_outcome(Outcome::S_REPLY),
  m_doc(std::move(doc))
{
  if (root_tag(m_doc) == S_EXCEPTION_TAG)
  {
    m_outcome = Outcome::S_REMOTE_FAULT;
  }
}

Reply::Outcome Reply::outcome() const
{
  return m_outcome;
}

bool Reply::canceled() const
{
  return m_outcome == Outcome::S_CANCELED;
}

const Document& Reply::document() const
{
  return m_doc;
}

std::optional<Remote_fault> Reply::fault() const
{
  if (m_outcome != Outcome::S_REMOTE_FAULT)
  {
    return std::nullopt;
  }
  // else
  return Remote_fault(root_element(m_doc));
}

std::ostream& operator<<(std::ostream& os, Reply::Outcome val)
{
  switch (val)
  {
  case Reply::Outcome::S_REPLY: return os << "REPLY";
  case Reply::Outcome::S_REMOTE_FAULT: return os << "REMOTE_FAULT";
  case Reply::Outcome::S_CANCELED: return os << "CANCELED";
  }
  return os;
}

} // namespace dedbg::session
