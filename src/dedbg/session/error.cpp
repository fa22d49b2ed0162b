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
#include "dedbg/session/error.hpp"
#include <cassert>
#include <istream>
#include <ostream>

namespace dedbg::session::error
{

// Types.

/**
 * The boost.system category for errors returned by the dedbg::session module.  Analogous to
 * transport::error::Category.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's conceptual name.  For example, this may be printed
   * when an error code of this category is printed to a stream.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns a string representing the message for the given error code value.
   *
   * @param val
   *        Error code value.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Helper that returns a brief string representing the symbol of the given `enum` value, sans the
   * "S_" prefix.
   *
   * @param code
   *        The code.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "dedbg/session";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_NOT_CONNECTED:
    return "Request not sent: the debug session is not connected to the server at this time.";
  case Code::S_REQUEST_CANCELED:
    return "Request abandoned before its reply arrived: the caller's cancellation signal fired, or the timeout "
           "elapsed, or the connection on which it was sent was lost.";
  case Code::S_REMOTE_FAULT:
    return "The server replied to the request with an exception envelope instead of a result.";
  case Code::S_MALFORMED_MESSAGE:
    return "An incoming message could not be parsed as a well-formed document.";
  case Code::S_MESSAGE_TOO_LARGE:
    return "An incoming message exceeded the receive buffer capacity; connection closed.";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "Async completion handler is being called prematurely, because underlying object is shutting down, "
           "as user desires.";
  case Code::S_INVALID_CONFIG:
    return "Session configuration is invalid: the receive buffer capacity is zero.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_NOT_CONNECTED:
    return "NOT_CONNECTED";
  case Code::S_REQUEST_CANCELED:
    return "REQUEST_CANCELED";
  case Code::S_REMOTE_FAULT:
    return "REMOTE_FAULT";
  case Code::S_MALFORMED_MESSAGE:
    return "MALFORMED_MESSAGE";
  case Code::S_MESSAGE_TOO_LARGE:
    return "MESSAGE_TOO_LARGE";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER";
  case Code::S_INVALID_CONFIG:
    return "INVALID_CONFIG";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace dedbg::session::error
