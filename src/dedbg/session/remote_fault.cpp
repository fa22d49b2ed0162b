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
#include "dedbg/session/remote_fault.hpp"
#include "dedbg/session/error.hpp"
#include <flow/util/util.hpp>
#include <ostream>

namespace dedbg::session
{

namespace
{

/**
 * File-local helper: attribute of the fault element, or the given default if absent or empty.
 *
 * @param element
 *        Fault element.
 * @param name
 *        Attribute name.
 * @param default_val
 *        Default.
 * @return See above.
 */
std::string attribute_or(const Document& element, const std::string& name, const std::string& default_val)
{
  const auto val = attribute(element, name);
  return (val && (!val->empty())) ? *val : default_val;
}

} // namespace (anon)

// Implementations.

Remote_fault::Remote_fault(const Document& exception_element) :
  flow::error::Runtime_error(error::Code::S_REMOTE_FAULT,
                             flow::util::ostream_op_string
                               ("Remote fault [", attribute_or(exception_element, "type", "Exception"),
                                "]: [", attribute_or(exception_element, "message", "No message"), ']')),
  m_message(attribute_or(exception_element, "message", "No message")),
  m_exception_type(attribute_or(exception_element, "type", "Exception"))
{
  const auto stack_trace = exception_element.get_child_optional("stackTrace");
  if (stack_trace)
  {
    m_remote_stack_trace = stack_trace->data();
  }
}

const std::string& Remote_fault::message() const
{
  return m_message;
}

const std::string& Remote_fault::exception_type() const
{
  return m_exception_type;
}

const std::optional<std::string>& Remote_fault::remote_stack_trace() const
{
  return m_remote_stack_trace;
}

std::ostream& operator<<(std::ostream& os, const Remote_fault& val)
{
  os << '[' << val.exception_type() << "]: [" << val.message() << ']';
  if (val.remote_stack_trace())
  {
    os << " remote stack trace:\n" << *val.remote_stack_trace();
  }
  return os;
}

} // namespace dedbg::session
