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

#include "dedbg/common.hpp"
#include <boost/property_tree/ptree.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace dedbg::session
{

// Types.

/**
 * An XML document as exchanged with the debug server: a property tree with exactly one child, the root element.
 * Element attributes are stored, in the usual boost.property_tree way, in the child named #S_XML_ATTR_KEY;
 * element text is the tree's `data()`.
 */
using Document = boost::property_tree::ptree;

/// The request/reply correlation token.  0 is reserved (means "none": unsolicited message).
using token_t = int32_t;

// Constants.

/// Name of the pseudo-child holding an element's attributes.
extern const std::string S_XML_ATTR_KEY;

/// Root tag of a reply carrying a remote fault.
extern const std::string S_EXCEPTION_TAG;

// Free functions.

/**
 * Builds a `use` envelope: `<use node="..."/>`.
 *
 * @param node_path
 *        Remote node to select.
 * @return See above.
 */
Document make_use_envelope(util::String_view node_path);

/**
 * Builds an `execute` envelope: `<execute>command text</execute>`.
 *
 * @param command
 *        Free-form command text.
 * @return See above.
 */
Document make_execute_envelope(util::String_view command);

/**
 * Builds a `member` envelope: `<member/>`.
 * @return See above.
 */
Document make_member_envelope();

/**
 * Builds a `list` envelope: `<list r="true|false"/>`.
 *
 * @param recursive
 *        Value of the `r` attribute.
 * @return See above.
 */
Document make_list_envelope(bool recursive);

/**
 * Returns the tag of the root element; empty string if `doc` has no root element.
 *
 * @param doc
 *        Document.
 * @return See above.
 */
std::string root_tag(const Document& doc);

/**
 * Returns the root element of `doc`; or an empty tree if there is none.
 *
 * @param doc
 *        Document.
 * @return See above.  Reference valid while `doc` is unchanged.
 */
const Document& root_element(const Document& doc);

/**
 * Returns the given attribute of the given element; `nullopt` if absent.
 *
 * @param element
 *        An element (e.g., from root_element()).
 * @param name
 *        Attribute name.
 * @return See above.
 */
std::optional<std::string> attribute(const Document& element, const std::string& name);

/**
 * Sets the `token` attribute of the root element of `doc` (which must have one).
 *
 * @param doc
 *        Document.
 * @param token
 *        Token.
 */
void stamp_token(Document* doc, token_t token);

/**
 * Reads the `token` attribute of the root element; 0 if absent or not a decimal integer in range.
 *
 * @param doc
 *        Document.
 * @return See above.
 */
token_t read_token(const Document& doc);

/**
 * Serializes `doc` as XML text, without the XML declaration and without indentation.
 *
 * @param doc
 *        Document.
 * @return See above.
 */
std::string serialize(const Document& doc);

/**
 * Parses XML text into a Document.
 *
 * @param text
 *        XML text.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        session::error::Code::S_MALFORMED_MESSAGE (not well-formed XML, or no root element).
 * @return The document; empty if an error is emitted.
 */
Document parse_document(util::String_view text, Error_code* err_code = 0);

} // namespace dedbg::session
