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
#include "dedbg/session/envelope.hpp"
#include "dedbg/session/error.hpp"
#include <flow/error/error.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <cassert>
#include <sstream>

namespace dedbg::session
{

namespace
{

/**
 * File-local helper: makes a Document whose root element has the given tag and content.
 *
 * @param tag
 *        Root tag.
 * @param root
 *        Root element content (attributes, text).
 * @return See above.
 */
Document make_envelope(const std::string& tag, Document&& root)
{
  Document doc;
  doc.push_back(Document::value_type(tag, std::move(root)));
  return doc;
}

/// File-local helper: the empty tree returned by root_element() if there is no root.
const Document S_EMPTY_ELEMENT;

} // namespace (anon)

// Static initializations.

const std::string S_XML_ATTR_KEY = "<xmlattr>";
const std::string S_EXCEPTION_TAG = "exception";

// Implementations.

Document make_use_envelope(util::String_view node_path)
{
  Document root;
  root.put_child(Document::path_type(S_XML_ATTR_KEY + "/node", '/'), Document(std::string(node_path)));
  return make_envelope("use", std::move(root));
}

Document make_execute_envelope(util::String_view command)
{
  return make_envelope("execute", Document(std::string(command)));
}

Document make_member_envelope()
{
  return make_envelope("member", Document());
}

Document make_list_envelope(bool recursive)
{
  Document root;
  root.put_child(Document::path_type(S_XML_ATTR_KEY + "/r", '/'), Document(recursive ? "true" : "false"));
  return make_envelope("list", std::move(root));
}

std::string root_tag(const Document& doc)
{
  return doc.empty() ? std::string() : doc.front().first;
}

const Document& root_element(const Document& doc)
{
  return doc.empty() ? S_EMPTY_ELEMENT : doc.front().second;
}

std::optional<std::string> attribute(const Document& element, const std::string& name)
{
  const auto attrs = element.get_child_optional(Document::path_type(S_XML_ATTR_KEY, '/'));
  if (!attrs)
  {
    return std::nullopt;
  }
  // else
  const auto it = attrs->find(name);
  if (it == attrs->not_found())
  {
    return std::nullopt;
  }
  // else
  return it->second.data();
}

void stamp_token(Document* doc, token_t token)
{
  assert((!doc->empty()) && "Can only stamp an envelope with a root element.");
  doc->front().second.put_child(Document::path_type(S_XML_ATTR_KEY + "/token", '/'),
                                Document(std::to_string(token)));
}

token_t read_token(const Document& doc)
{
  const auto token_str = attribute(root_element(doc), "token");
  token_t token = 0;
  if (token_str && boost::conversion::try_lexical_convert(*token_str, token))
  {
    return token;
  }
  // else
  return 0;
}

std::string serialize(const Document& doc)
{
  using boost::property_tree::xml_parser::write_xml_element;
  using Settings = boost::property_tree::xml_parser::xml_writer_settings<std::string>;

  std::ostringstream os;
  // Same as write_xml() minus the <?xml ...?> declaration.
  write_xml_element(os, std::string(), doc, -1, Settings());
  return os.str();
}

Document parse_document(util::String_view text, Error_code* err_code)
{
  namespace xml_parser = boost::property_tree::xml_parser;

  Document doc;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Document { return parse_document(text, actual_err_code); },
         &doc, err_code, "session::parse_document()"))
  {
    return doc;
  }
  // else

  std::istringstream is{std::string(text)};
  try
  {
    xml_parser::read_xml(is, doc, xml_parser::no_comments);
  }
  catch (const xml_parser::xml_parser_error&)
  {
    *err_code = error::Code::S_MALFORMED_MESSAGE;
    return Document();
  }

  if (doc.size() != 1)
  {
    *err_code = error::Code::S_MALFORMED_MESSAGE;
    return Document();
  }
  // else

  err_code->clear();
  return doc;
} // parse_document()

} // namespace dedbg::session
