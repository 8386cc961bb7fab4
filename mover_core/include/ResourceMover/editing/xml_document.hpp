#pragma once

/**
 * @file xml_document.hpp
 * @brief Formatting-preserving model of a resource XML file
 *
 * The document is kept as the exact source text split into:
 * - prolog (declaration, comments, doctype before the root)
 * - root start tag
 * - an ordered list of root children (elements, text, comments, ...)
 * - root end tag
 * - epilog
 *
 * Each child stores its raw bytes, so serializing an unmodified document
 * reproduces the input exactly and removing a child leaves every sibling
 * untouched. Parsing is strict: the whole document must be well formed
 * even though only the root's direct children are modelled.
 */

#include "ResourceMover/core/result.hpp"
#include "ResourceMover/core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ResourceMover::editing {

enum class XmlNodeKind { Element, Text, Comment, CData, ProcessingInstruction };

struct XmlAttribute {
  std::string name;
  std::string value;
};

struct XmlNode {
  XmlNodeKind kind = XmlNodeKind::Text;
  std::string raw;
  std::string tagName;
  std::vector<XmlAttribute> attributes;

  [[nodiscard]] static XmlNode text(std::string content);

  [[nodiscard]] bool isElement() const { return kind == XmlNodeKind::Element; }
  [[nodiscard]] bool isComment() const { return kind == XmlNodeKind::Comment; }

  /**
   * @brief True for a text node made only of spaces, tabs and line breaks
   */
  [[nodiscard]] bool isWhitespace() const;

  /**
   * @brief Value of a start-tag attribute as written, or nullptr
   */
  [[nodiscard]] const std::string* attribute(std::string_view name) const;
};

class XmlDocument {
public:
  /**
   * @brief Parse a complete XML document
   * @param text Document text
   * @return The document, or an error naming the line of the first problem
   */
  [[nodiscard]] static Result<XmlDocument> parse(const std::string& text);

  /**
   * @brief A fresh values document: declaration plus an empty <resources> root
   */
  [[nodiscard]] static XmlDocument emptyResources();

  [[nodiscard]] const std::string& rootName() const { return m_rootName; }
  [[nodiscard]] const std::vector<XmlNode>& children() const { return m_children; }

  /**
   * @brief Number of element children of the root
   */
  [[nodiscard]] usize elementCount() const;

  /**
   * @brief Detach the element child at @p index with its leading annotation
   *
   * Also removes the whitespace node right before the element; when the
   * node before that whitespace is a comment, the comment and the
   * whitespace preceding it go as well. The removed nodes are returned in
   * document order.
   */
  std::vector<XmlNode> detachElement(usize index);

  void appendChild(XmlNode node);
  void appendChildren(std::vector<XmlNode> nodes);

  /**
   * @brief Collapse the leading whitespace children into one "\n" + indentation node
   */
  void trimStart(const std::string& indentation);

  [[nodiscard]] std::string serialize() const;

private:
  class Parser;

  XmlDocument() = default;

  std::string m_prolog;
  std::string m_rootStartTag;
  std::string m_rootName;
  bool m_rootSelfClosing = false;
  std::vector<XmlNode> m_children;
  std::string m_rootEndTag;
  std::string m_epilog;
};

} // namespace ResourceMover::editing
