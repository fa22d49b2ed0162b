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
#include "dedbg/session/client_value.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/unordered_map.hpp>
#include <limits>
#include <ostream>
#include <sstream>
#include <type_traits>

namespace dedbg::session
{

namespace
{

/// File-local helper: declared type name (sans assembly qualification) to Value_type.
const boost::unordered_map<std::string, Value_type> S_TYPE_NAME_MAP
  {
    { "object", Value_type::S_OBJECT }, { "System.Object", Value_type::S_OBJECT },
    { "string", Value_type::S_STRING }, { "System.String", Value_type::S_STRING },
    { "bool", Value_type::S_BOOL }, { "System.Boolean", Value_type::S_BOOL },
    { "char", Value_type::S_CHAR }, { "System.Char", Value_type::S_CHAR },
    { "sbyte", Value_type::S_SBYTE }, { "System.SByte", Value_type::S_SBYTE },
    { "byte", Value_type::S_BYTE }, { "System.Byte", Value_type::S_BYTE },
    { "short", Value_type::S_INT16 }, { "System.Int16", Value_type::S_INT16 },
    { "ushort", Value_type::S_UINT16 }, { "System.UInt16", Value_type::S_UINT16 },
    { "int", Value_type::S_INT32 }, { "System.Int32", Value_type::S_INT32 },
    { "uint", Value_type::S_UINT32 }, { "System.UInt32", Value_type::S_UINT32 },
    { "long", Value_type::S_INT64 }, { "System.Int64", Value_type::S_INT64 },
    { "ulong", Value_type::S_UINT64 }, { "System.UInt64", Value_type::S_UINT64 },
    { "float", Value_type::S_FLOAT }, { "System.Single", Value_type::S_FLOAT },
    { "double", Value_type::S_DOUBLE }, { "System.Double", Value_type::S_DOUBLE },
    { "decimal", Value_type::S_DECIMAL }, { "System.Decimal", Value_type::S_DECIMAL }
  };

/// File-local helper: the declared type name of nested values.
const std::string S_TABLE_TYPE_NAME = "table";

/**
 * File-local helper: converts text to a signed integer in `[min_val, max_val]`.
 *
 * @param text
 *        Trimmed text.
 * @param min_val
 *        Lowest allowed.
 * @param max_val
 *        Highest allowed.
 * @return The value; or `nullopt` on failure.
 */
std::optional<Client_value::Value> convert_signed(const std::string& text, int64_t min_val, int64_t max_val)
{
  int64_t val;
  if ((!boost::conversion::try_lexical_convert(text, val)) || (val < min_val) || (val > max_val))
  {
    return std::nullopt;
  }
  // else
  return Client_value::Value(std::in_place_type<int64_t>, val);
}

/**
 * File-local helper: converts text to an unsigned integer in `[0, max_val]`.
 *
 * @param text
 *        Trimmed text.
 * @param max_val
 *        Highest allowed.
 * @return The value; or `nullopt` on failure.
 */
std::optional<Client_value::Value> convert_unsigned(const std::string& text, uint64_t max_val)
{
  // lexical_cast would happily wrap "-1" around.
  uint64_t val;
  if (boost::starts_with(text, "-")
      || (!boost::conversion::try_lexical_convert(text, val)) || (val > max_val))
  {
    return std::nullopt;
  }
  // else
  return Client_value::Value(std::in_place_type<uint64_t>, val);
}

/**
 * File-local helper: converts text to a floating-point value of type `Float`, held as `double`.
 *
 * @tparam Float
 *         `float` or `double`.
 * @param text
 *        Trimmed text.
 * @return The value; or `nullopt` on failure.
 */
template<typename Float>
std::optional<Client_value::Value> convert_float(const std::string& text)
{
  Float val;
  if (!boost::conversion::try_lexical_convert(text, val))
  {
    return std::nullopt;
  }
  // else
  return Client_value::Value(std::in_place_type<double>, static_cast<double>(val));
}

/**
 * File-local helper: converts the text of a value element to the given type.
 *
 * @param text
 *        Element text, untrimmed.
 * @param type
 *        Target type.
 * @return The value; or `nullopt` if the text is not a valid representation of a `type` value.
 */
std::optional<Client_value::Value> convert(const std::string& text, Value_type type)
{
  using boost::algorithm::iequals;
  using Value = Client_value::Value;
  using std::numeric_limits;

  const auto trimmed = boost::algorithm::trim_copy(text);

  switch (type)
  {
  case Value_type::S_OBJECT:
  case Value_type::S_STRING:
    return Value(std::in_place_type<std::string>, text);
  case Value_type::S_BOOL:
    if (iequals(trimmed, "true"))
    {
      return Value(std::in_place_type<bool>, true);
    }
    if (iequals(trimmed, "false"))
    {
      return Value(std::in_place_type<bool>, false);
    }
    return std::nullopt;
  case Value_type::S_CHAR:
    if (text.size() != 1)
    {
      return std::nullopt;
    }
    return Value(std::in_place_type<char>, text.front());
  case Value_type::S_SBYTE:
    return convert_signed(trimmed, numeric_limits<int8_t>::min(), numeric_limits<int8_t>::max());
  case Value_type::S_BYTE:
    return convert_unsigned(trimmed, numeric_limits<uint8_t>::max());
  case Value_type::S_INT16:
    return convert_signed(trimmed, numeric_limits<int16_t>::min(), numeric_limits<int16_t>::max());
  case Value_type::S_UINT16:
    return convert_unsigned(trimmed, numeric_limits<uint16_t>::max());
  case Value_type::S_INT32:
    return convert_signed(trimmed, numeric_limits<int32_t>::min(), numeric_limits<int32_t>::max());
  case Value_type::S_UINT32:
    return convert_unsigned(trimmed, numeric_limits<uint32_t>::max());
  case Value_type::S_INT64:
    return convert_signed(trimmed, numeric_limits<int64_t>::min(), numeric_limits<int64_t>::max());
  case Value_type::S_UINT64:
    return convert_unsigned(trimmed, numeric_limits<uint64_t>::max());
  case Value_type::S_FLOAT:
    return convert_float<float>(trimmed);
  case Value_type::S_DOUBLE:
  case Value_type::S_DECIMAL:
    return convert_float<double>(trimmed);
  }
  return std::nullopt;
} // convert()

} // namespace (anon)

// Client_value implementations.

Client_value::Client_value(std::string&& name, std::string&& type_name, std::optional<Value_type> type_or_none,
                           Value&& value) :
  m_name(std::move(name)),
  m_type_name(std::move(type_name)),
  m_type_or_none(type_or_none),
  m_value(std::move(value))
{
  // Nothing else.
}

const std::string& Client_value::name() const
{
  return m_name;
}

const std::string& Client_value::type_name() const
{
  return m_type_name;
}

const std::optional<Value_type>& Client_value::type() const
{
  return m_type_or_none;
}

bool Client_value::converted() const
{
  return m_type_or_none.has_value();
}

bool Client_value::is_table() const
{
  return std::holds_alternative<Table>(m_value);
}

const Client_value::Value& Client_value::value() const
{
  return m_value;
}

const Client_value::Table& Client_value::table() const
{
  return std::get<Table>(m_value);
}

std::string Client_value::value_as_string() const
{
  return std::visit([&](const auto& val) -> std::string
  {
    using T = std::decay_t<decltype(val)>;

    if constexpr(std::is_same_v<T, Table>)
    {
      return "table[" + std::to_string(val.size()) + ']';
    }
    else if constexpr(std::is_same_v<T, std::string>)
    {
      // An `object` shows as is; anything else held as text is a string (converted or not).
      return (m_type_or_none == Value_type::S_OBJECT) ? val : ('\'' + val + '\'');
    }
    else if constexpr(std::is_same_v<T, bool>)
    {
      return val ? "true" : "false";
    }
    else if constexpr(std::is_same_v<T, char>)
    {
      return std::string(1, val);
    }
    else if constexpr(std::is_same_v<T, double>)
    {
      std::ostringstream os;
      os.precision(std::numeric_limits<double>::digits10);
      os << val;
      return os.str();
    }
    else
    {
      return std::to_string(val);
    }
  }, m_value);
} // Client_value::value_as_string()

// Free function implementations.

std::optional<Value_type> resolve_value_type(util::String_view type_name)
{
  const auto comma_pos = type_name.find(',');
  const auto bare_name = boost::algorithm::trim_copy(std::string(type_name.substr(0, comma_pos)));

  const auto it = S_TYPE_NAME_MAP.find(bare_name);
  if (it == S_TYPE_NAME_MAP.end())
  {
    return std::nullopt;
  }
  // else
  return it->second;
}

Client_value parse_value(flow::log::Logger* logger_ptr, const Document& element, int positional_index)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_VALUE);

  auto name = attribute(element, "n").value_or(std::string());
  if (name.empty())
  {
    const auto index_attr = attribute(element, "i");
    name = '$' + ((index_attr && (!index_attr->empty())) ? *index_attr : std::to_string(positional_index));
  }

  auto type_name = attribute(element, "t").value_or("object");

  if (type_name == S_TABLE_TYPE_NAME)
  {
    return Client_value(std::move(name), std::move(type_name), std::nullopt,
                        Client_value::Value(parse_return(logger_ptr, element, 1)));
  }
  // else

  const auto& text = element.data();
  const auto type_or_none = resolve_value_type(type_name);
  if (!type_or_none)
  {
    FLOW_LOG_TRACE("Value [" << name << "]: Declared type [" << type_name << "] unknown; keeping raw text.");
    return Client_value(std::move(name), std::move(type_name), std::nullopt, Client_value::Value(text));
  }
  // else

  auto value_or_none = convert(text, *type_or_none);
  if (!value_or_none)
  {
    FLOW_LOG_TRACE("Value [" << name << "]: Text [" << text << "] does not convert to declared type "
                   "[" << type_name << "]; keeping raw text.");
    return Client_value(std::move(name), std::move(type_name), std::nullopt, Client_value::Value(text));
  }
  // else

  return Client_value(std::move(name), std::move(type_name), type_or_none, std::move(*value_or_none));
} // parse_value()

Client_value::Table parse_return(flow::log::Logger* logger_ptr, const Document& element, int start_index)
{
  Client_value::Table values;
  int index = start_index;
  for (const auto& child : element)
  {
    if (child.first == "v")
    {
      values.push_back(parse_value(logger_ptr, child.second, index++));
    }
  }
  return values;
}

std::ostream& operator<<(std::ostream& os, const Client_value& val)
{
  return os << val.name() << ':' << val.type_name() << " = " << val.value_as_string();
}

std::ostream& operator<<(std::ostream& os, Value_type val)
{
  switch (val)
  {
  case Value_type::S_OBJECT: return os << "OBJECT";
  case Value_type::S_STRING: return os << "STRING";
  case Value_type::S_BOOL: return os << "BOOL";
  case Value_type::S_CHAR: return os << "CHAR";
  case Value_type::S_SBYTE: return os << "SBYTE";
  case Value_type::S_BYTE: return os << "BYTE";
  case Value_type::S_INT16: return os << "INT16";
  case Value_type::S_UINT16: return os << "UINT16";
  case Value_type::S_INT32: return os << "INT32";
  case Value_type::S_UINT32: return os << "UINT32";
  case Value_type::S_INT64: return os << "INT64";
  case Value_type::S_UINT64: return os << "UINT64";
  case Value_type::S_FLOAT: return os << "FLOAT";
  case Value_type::S_DOUBLE: return os << "DOUBLE";
  case Value_type::S_DECIMAL: return os << "DECIMAL";
  }
  return os;
}

} // namespace dedbg::session
