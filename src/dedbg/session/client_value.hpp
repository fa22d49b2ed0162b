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

#include "dedbg/session/envelope.hpp"
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dedbg::session
{

// Types.

/**
 * The runtime types to which a declared wire type name can resolve.  The server declares types by scripting
 * alias (`int`, `long`, `string`, ...) or by .NET name (`System.Int32`, possibly assembly-qualified).
 */
enum class Value_type
{
  /// `object`, `System.Object`: kept as text.
  S_OBJECT,
  /// `string`, `System.String`.
  S_STRING,
  /// `bool`, `System.Boolean`.
  S_BOOL,
  /// `char`, `System.Char`.
  S_CHAR,
  /// `sbyte`, `System.SByte`.
  S_SBYTE,
  /// `byte`, `System.Byte`.
  S_BYTE,
  /// `short`, `System.Int16`.
  S_INT16,
  /// `ushort`, `System.UInt16`.
  S_UINT16,
  /// `int`, `System.Int32`.
  S_INT32,
  /// `uint`, `System.UInt32`.
  S_UINT32,
  /// `long`, `System.Int64`.
  S_INT64,
  /// `ulong`, `System.UInt64`.
  S_UINT64,
  /// `float`, `System.Single`.
  S_FLOAT,
  /// `double`, `System.Double`.
  S_DOUBLE,
  /// `decimal`, `System.Decimal`; held as `double`.
  S_DECIMAL
}; // enum class Value_type

/**
 * One named value from a value-bearing reply (`<v n=".." t="..">text</v>`): a member of the object listed by
 * `member`, or one of the results of `execute`.  Obtain these via parse_value() and parse_return(); the object is
 * immutable after that.
 *
 * The held value() is one of:
 *   - #Table (if and only if type_name() is `table`): the nested values, in document order;
 *   - a scalar converted from the element text according to type(), if the declared type name resolved and the
 *     text converted successfully; signed integers as `int64_t`, unsigned as `uint64_t`, floating-point as
 *     `double`, `bool`, `char`; `object` and `string` as `std::string`;
 *   - otherwise the raw element text as `std::string`, with type() empty.
 */
class Client_value
{
public:
  // Types.

  /// Nested values of a `table`.
  using Table = std::vector<Client_value>;

  /// See class doc header.
  using Value = std::variant<std::string, bool, char, int64_t, uint64_t, double, Table>;

  // Constructors/destructor.

  /**
   * Constructs the value from its parts.
   *
   * @param name
   *        See name().
   * @param type_name
   *        See type_name().
   * @param type_or_none
   *        See type().
   * @param value
   *        See value().
   */
  explicit Client_value(std::string&& name, std::string&& type_name, std::optional<Value_type> type_or_none,
                        Value&& value);

  // Methods.

  /**
   * The member name (`n` attribute); or `$` followed by the positional index for unnamed values.
   * @return See above.
   */
  const std::string& name() const;

  /**
   * The declared wire type name (`t` attribute) verbatim; `object` if none was declared.
   * @return See above.
   */
  const std::string& type_name() const;

  /**
   * The resolved runtime type; empty if the value is a table, or if resolution or conversion failed.
   * @return See above.
   */
  const std::optional<Value_type>& type() const;

  /**
   * Equivalent to `type().has_value()`.
   * @return See above.
   */
  bool converted() const;

  /**
   * Whether value() holds a #Table.
   * @return See above.
   */
  bool is_table() const;

  /**
   * The value; see class doc header.
   * @return See above.
   */
  const Value& value() const;

  /**
   * The nested values.  Behavior undefined unless is_table().
   * @return See above.
   */
  const Table& table() const;

  /**
   * Display form of the value: text values (unconverted, or `string`) in single quotes; `table[N]` for a table
   * of N values; other scalars in canonical text form.
   *
   * @return See above.
   */
  std::string value_as_string() const;

private:
  // Data.

  /// See name().
  std::string m_name;

  /// See type_name().
  std::string m_type_name;

  /// See type().
  std::optional<Value_type> m_type_or_none;

  /// See value().
  Value m_value;
}; // class Client_value

// Free functions.

/**
 * Resolves a declared wire type name to a Value_type.  Text starting with the first comma (assembly
 * qualification) is ignored.  `table` and unknown names do not resolve.
 *
 * @param type_name
 *        E.g., "int", "System.Int32", "System.Int32, mscorlib, Version=4.0.0.0".
 * @return See above.
 */
std::optional<Value_type> resolve_value_type(util::String_view type_name);

/**
 * Converts one value element (`<v>`) into a Client_value.  Never fails: if the declared type does not resolve,
 * or the text does not convert to it, the value is the raw text, untyped.
 *
 * @param logger_ptr
 *        Logger to use for logging (degraded conversions are logged at TRACE level); may be null.
 * @param element
 *        The element.
 * @param positional_index
 *        Used for the name if the element has neither an `n` nor an `i` attribute: `$` followed by this.
 * @return See above.
 */
Client_value parse_value(flow::log::Logger* logger_ptr, const Document& element, int positional_index);

/**
 * Applies parse_value() to each child element tagged `v` of `element`, in document order, with positional index
 * starting at `start_index` and advancing by one per such child.
 *
 * @param logger_ptr
 *        See parse_value().
 * @param element
 *        E.g., root_element() of a reply to `execute` or `member`.
 * @param start_index
 *        See above.  Nested table values start at 1.
 * @return See above.
 */
Client_value::Table parse_return(flow::log::Logger* logger_ptr, const Document& element, int start_index = 0);

/**
 * Prints string representation of the given Client_value to the given `ostream`: `name:type_name = value`.
 *
 * @relatesalso Client_value
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Client_value& val);

/**
 * Prints the symbolic name of the given Value_type (sans the `S_` prefix) to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Value_type val);

} // namespace dedbg::session
