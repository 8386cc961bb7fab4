#include "ResourceMover/editing/xml_document.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace ResourceMover::editing {

namespace {

constexpr std::string_view kEmptyResourcesProlog = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
constexpr std::string_view kEmptyResourcesStartTag =
    "<resources xmlns:tools=\"http://schemas.android.com/tools\">";

bool isXmlWhitespace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool isNameStartChar(char c) {
  const auto uc = static_cast<unsigned char>(c);
  return std::isalpha(uc) || c == '_' || c == ':' || uc >= 0x80;
}

bool isNameChar(char c) {
  const auto uc = static_cast<unsigned char>(c);
  return isNameStartChar(c) || std::isdigit(uc) || c == '-' || c == '.';
}

bool isReferenceChar(char c) {
  const auto uc = static_cast<unsigned char>(c);
  return std::isalnum(uc) || c == '_' || c == '#';
}

} // namespace

// ============================================================================
// XmlNode
// ============================================================================

XmlNode XmlNode::text(std::string content) {
  XmlNode node;
  node.kind = XmlNodeKind::Text;
  node.raw = std::move(content);
  return node;
}

bool XmlNode::isWhitespace() const {
  return kind == XmlNodeKind::Text && std::all_of(raw.begin(), raw.end(), isXmlWhitespace);
}

const std::string* XmlNode::attribute(std::string_view name) const {
  for (const auto& attr : attributes) {
    if (attr.name == name) {
      return &attr.value;
    }
  }
  return nullptr;
}

// ============================================================================
// Parser
// ============================================================================

class XmlDocument::Parser {
public:
  explicit Parser(const std::string& text) : m_text(text) {}

  Result<XmlDocument> run() {
    XmlDocument document;

    if (startsWith("\xEF\xBB\xBF")) {
      m_pos += 3;
    }

    bool seenDoctype = false;
    while (true) {
      skipWhitespace();
      if (atEnd()) {
        return failure("document has no root element");
      }
      if (startsWith("<?")) {
        if (!parseProcessingInstruction()) {
          return failure();
        }
      } else if (startsWith("<!--")) {
        if (!parseComment()) {
          return failure();
        }
      } else if (startsWith("<!DOCTYPE")) {
        if (seenDoctype) {
          return failure("duplicate DOCTYPE declaration");
        }
        seenDoctype = true;
        if (!parseDoctype()) {
          return failure();
        }
      } else if (peek() == '<' && isNameStartChar(peekAt(1))) {
        break;
      } else {
        return failure("unexpected content before the root element");
      }
    }

    const usize rootStart = m_pos;
    document.m_prolog = m_text.substr(0, rootStart);

    std::vector<XmlAttribute> rootAttributes;
    bool selfClosing = false;
    if (!parseStartTag(document.m_rootName, rootAttributes, selfClosing)) {
      return failure();
    }
    document.m_rootStartTag = m_text.substr(rootStart, m_pos - rootStart);
    document.m_rootSelfClosing = selfClosing;

    if (!selfClosing) {
      usize endTagStart = 0;
      if (!parseContent(document.m_rootName, &document.m_children, endTagStart)) {
        return failure();
      }
      document.m_rootEndTag = m_text.substr(endTagStart, m_pos - endTagStart);
    }

    const usize epilogStart = m_pos;
    while (true) {
      skipWhitespace();
      if (atEnd()) {
        break;
      }
      if (startsWith("<?")) {
        if (!parseProcessingInstruction()) {
          return failure();
        }
      } else if (startsWith("<!--")) {
        if (!parseComment()) {
          return failure();
        }
      } else {
        return failure("unexpected content after the root element");
      }
    }
    document.m_epilog = m_text.substr(epilogStart);

    return Result<XmlDocument>::ok(std::move(document));
  }

private:
  [[nodiscard]] bool atEnd() const { return m_pos >= m_text.size(); }
  [[nodiscard]] char peek() const { return peekAt(0); }
  [[nodiscard]] char peekAt(usize offset) const {
    return m_pos + offset < m_text.size() ? m_text[m_pos + offset] : '\0';
  }
  [[nodiscard]] bool startsWith(std::string_view prefix) const {
    return m_text.compare(m_pos, prefix.size(), prefix) == 0;
  }

  void skipWhitespace() {
    while (!atEnd() && isXmlWhitespace(peek())) {
      ++m_pos;
    }
  }

  bool fail(const std::string& message) { return fail(message, m_pos); }

  bool fail(const std::string& message, usize position) {
    if (m_error.empty()) {
      const usize end = std::min(position, m_text.size());
      const auto line = 1 + std::count(m_text.begin(), m_text.begin() + static_cast<long>(end), '\n');
      m_error = "line " + std::to_string(line) + ": " + message;
    }
    return false;
  }

  Result<XmlDocument> failure(const std::string& message = {}) {
    if (!message.empty()) {
      fail(message);
    }
    return Result<XmlDocument>::error(m_error);
  }

  bool skipPast(std::string_view terminator, const char* what) {
    const usize start = m_pos;
    const usize found = m_text.find(terminator, m_pos);
    if (found == std::string::npos) {
      return fail(std::string("unterminated ") + what, start);
    }
    m_pos = found + terminator.size();
    return true;
  }

  bool parseComment() { return skipPast("-->", "comment"); }
  bool parseCData() { return skipPast("]]>", "CDATA section"); }
  bool parseProcessingInstruction() { return skipPast("?>", "processing instruction"); }

  bool parseDoctype() {
    const usize start = m_pos;
    i32 depth = 0;
    char quote = '\0';
    for (; !atEnd(); ++m_pos) {
      const char c = peek();
      if (quote != '\0') {
        if (c == quote) {
          quote = '\0';
        }
      } else if (c == '"' || c == '\'') {
        quote = c;
      } else if (c == '[') {
        ++depth;
      } else if (c == ']') {
        --depth;
      } else if (c == '>' && depth == 0) {
        ++m_pos;
        return true;
      }
    }
    return fail("unterminated DOCTYPE declaration", start);
  }

  bool parseName(std::string& out) {
    if (atEnd() || !isNameStartChar(peek())) {
      return fail("expected a name");
    }
    const usize start = m_pos;
    while (!atEnd() && isNameChar(peek())) {
      ++m_pos;
    }
    out = m_text.substr(start, m_pos - start);
    return true;
  }

  bool checkReferences(usize start, usize end) {
    for (usize i = start; i < end; ++i) {
      if (m_text[i] != '&') {
        continue;
      }
      usize j = i + 1;
      while (j < end && isReferenceChar(m_text[j])) {
        ++j;
      }
      if (j == i + 1 || j >= end || m_text[j] != ';') {
        return fail("unescaped '&'", i);
      }
      i = j;
    }
    return true;
  }

  bool parseStartTag(std::string& name, std::vector<XmlAttribute>& attributes,
                     bool& selfClosing) {
    ++m_pos; // '<'
    if (!parseName(name)) {
      return false;
    }

    while (true) {
      const usize beforeWhitespace = m_pos;
      skipWhitespace();
      if (atEnd()) {
        return fail("unterminated start tag <" + name + ">");
      }
      if (startsWith("/>")) {
        m_pos += 2;
        selfClosing = true;
        return true;
      }
      if (peek() == '>') {
        ++m_pos;
        selfClosing = false;
        return true;
      }
      if (m_pos == beforeWhitespace) {
        return fail("expected whitespace between attributes of <" + name + ">");
      }

      XmlAttribute attr;
      if (!parseName(attr.name)) {
        return false;
      }
      skipWhitespace();
      if (peek() != '=') {
        return fail("expected '=' after attribute " + attr.name);
      }
      ++m_pos;
      skipWhitespace();
      const char quote = peek();
      if (quote != '"' && quote != '\'') {
        return fail("expected a quoted value for attribute " + attr.name);
      }
      const usize valueStart = m_pos + 1;
      const usize valueEnd = m_text.find(quote, valueStart);
      if (valueEnd == std::string::npos) {
        return fail("unterminated value of attribute " + attr.name);
      }
      if (m_text.find('<', valueStart) < valueEnd) {
        return fail("'<' in value of attribute " + attr.name, valueStart);
      }
      if (!checkReferences(valueStart, valueEnd)) {
        return false;
      }
      attr.value = m_text.substr(valueStart, valueEnd - valueStart);
      m_pos = valueEnd + 1;

      for (const auto& existing : attributes) {
        if (existing.name == attr.name) {
          return fail("duplicate attribute " + attr.name + " on <" + name + ">");
        }
      }
      attributes.push_back(std::move(attr));
    }
  }

  bool parseEndTag(const std::string& expectedName) {
    m_pos += 2; // "</"
    std::string name;
    if (!parseName(name)) {
      return false;
    }
    if (name != expectedName) {
      return fail("mismatched end tag </" + name + ">, expected </" + expectedName + ">");
    }
    skipWhitespace();
    if (peek() != '>') {
      return fail("unterminated end tag </" + name + ">");
    }
    ++m_pos;
    return true;
  }

  bool parseElement(std::string& name, std::vector<XmlAttribute>& attributes) {
    bool selfClosing = false;
    if (!parseStartTag(name, attributes, selfClosing)) {
      return false;
    }
    if (selfClosing) {
      return true;
    }
    usize endTagStart = 0;
    return parseContent(name, nullptr, endTagStart);
  }

  /**
   * Parse element content up to and including the end tag of @p name.
   * When @p nodes is set every direct child is recorded there.
   */
  bool parseContent(const std::string& name, std::vector<XmlNode>* nodes, usize& endTagStart) {
    while (true) {
      if (atEnd()) {
        return fail("unterminated element <" + name + ">");
      }

      const usize start = m_pos;
      XmlNode node;

      if (startsWith("</")) {
        endTagStart = start;
        return parseEndTag(name);
      } else if (startsWith("<!--")) {
        node.kind = XmlNodeKind::Comment;
        if (!parseComment()) {
          return false;
        }
      } else if (startsWith("<![CDATA[")) {
        node.kind = XmlNodeKind::CData;
        if (!parseCData()) {
          return false;
        }
      } else if (startsWith("<?")) {
        node.kind = XmlNodeKind::ProcessingInstruction;
        if (!parseProcessingInstruction()) {
          return false;
        }
      } else if (startsWith("<!")) {
        return fail("unexpected markup declaration inside <" + name + ">");
      } else if (peek() == '<') {
        node.kind = XmlNodeKind::Element;
        if (!parseElement(node.tagName, node.attributes)) {
          return false;
        }
      } else {
        node.kind = XmlNodeKind::Text;
        const usize textEnd = std::min(m_text.find('<', m_pos), m_text.size());
        if (!checkReferences(m_pos, textEnd)) {
          return false;
        }
        m_pos = textEnd;
      }

      if (nodes != nullptr) {
        node.raw = m_text.substr(start, m_pos - start);
        nodes->push_back(std::move(node));
      }
    }
  }

  const std::string& m_text;
  usize m_pos = 0;
  std::string m_error;
};

// ============================================================================
// XmlDocument
// ============================================================================

Result<XmlDocument> XmlDocument::parse(const std::string& text) {
  Parser parser(text);
  return parser.run();
}

XmlDocument XmlDocument::emptyResources() {
  XmlDocument document;
  document.m_prolog = std::string(kEmptyResourcesProlog);
  document.m_rootStartTag = std::string(kEmptyResourcesStartTag);
  document.m_rootName = "resources";
  document.m_children.push_back(XmlNode::text("\n"));
  document.m_rootEndTag = "</resources>";
  document.m_epilog = "\n";
  return document;
}

usize XmlDocument::elementCount() const {
  return static_cast<usize>(std::count_if(m_children.begin(), m_children.end(),
                                          [](const XmlNode& node) { return node.isElement(); }));
}

std::vector<XmlNode> XmlDocument::detachElement(usize index) {
  if (index >= m_children.size() || !m_children[index].isElement()) {
    return {};
  }

  usize first = index;
  if (first >= 1 && m_children[first - 1].isWhitespace()) {
    --first;
    if (first >= 1 && m_children[first - 1].isComment()) {
      --first;
      if (first >= 1 && m_children[first - 1].isWhitespace()) {
        --first;
      }
    }
  }

  const auto begin = m_children.begin() + static_cast<long>(first);
  const auto end = m_children.begin() + static_cast<long>(index) + 1;
  std::vector<XmlNode> detached(std::make_move_iterator(begin), std::make_move_iterator(end));
  m_children.erase(begin, end);
  return detached;
}

void XmlDocument::appendChild(XmlNode node) {
  m_children.push_back(std::move(node));
}

void XmlDocument::appendChildren(std::vector<XmlNode> nodes) {
  m_children.insert(m_children.end(), std::make_move_iterator(nodes.begin()),
                    std::make_move_iterator(nodes.end()));
}

void XmlDocument::trimStart(const std::string& indentation) {
  const auto firstContent = std::find_if(m_children.begin(), m_children.end(),
                                         [](const XmlNode& node) { return !node.isWhitespace(); });
  m_children.erase(m_children.begin(), firstContent);
  m_children.insert(m_children.begin(), XmlNode::text("\n" + indentation));
}

std::string XmlDocument::serialize() const {
  std::string out = m_prolog;

  if (m_rootSelfClosing && !m_children.empty()) {
    // <resources/> gained children: reopen it as <resources>...</resources>
    std::string startTag = m_rootStartTag.substr(0, m_rootStartTag.size() - 2);
    out += startTag + ">";
  } else {
    out += m_rootStartTag;
  }

  for (const auto& child : m_children) {
    out += child.raw;
  }

  if (m_rootSelfClosing) {
    if (!m_children.empty()) {
      out += "</" + m_rootName + ">";
    }
  } else {
    out += m_rootEndTag;
  }

  out += m_epilog;
  return out;
}

} // namespace ResourceMover::editing
