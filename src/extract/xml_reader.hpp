#ifndef DOCSANITIZER_EXTRACT_XML_READER_HPP
#define DOCSANITIZER_EXTRACT_XML_READER_HPP

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <libxml/xmlreader.h>

/**
 * @file xml_reader.hpp
 * @brief Pull-style walk over the OOXML parts we read, on top of libxml2's
 *        xmlTextReader.
 *
 * Comments, processing instructions and the DOCTYPE are skipped. CDATA and
 * whitespace nodes are reported as Text. Network access and error output of
 * libxml2 are disabled; a document that is not well-formed throws XmlError.
 *
 * USAGE:
 *   @code
 *   XmlReader reader(xml);
 *   while (reader.next() != XmlReader::Token::End) {
 *       if (reader.token() == XmlReader::Token::StartElement && reader.localName() == "t") { ... }
 *   }
 *   @endcode
 */

namespace docsanitizer {
namespace extract {

class XmlError : public std::runtime_error
{
public:
    explicit XmlError(const std::string &message)
        : std::runtime_error("xml: " + message)
    {
    }
};

class XmlReader
{
public:
    enum class Token {
        StartElement,
        EndElement,
        Text,
        End
    };

    /**
     * The reader parses @p xml in place; it must outlive the reader.
     * @throw XmlError for an empty document.
     */
    explicit XmlReader(const std::string &xml);

    /**
     * @brief Advance to the next token. A self-closing element produces a
     *        StartElement followed by an EndElement.
     * @throw XmlError on malformed input.
     */
    Token next();

    Token token() const { return token_; }

    /// Qualified element name for Start/EndElement.
    const std::string &name() const { return name_; }

    /// Element name without its namespace prefix.
    const std::string &localName() const { return localName_; }

    /// Decoded character data for Text tokens.
    const std::string &text() const { return text_; }

    /// Attribute of the current StartElement by qualified name.
    std::optional<std::string> attribute(const std::string &qualifiedName) const;

    /// First attribute whose name, without prefix, is @p localName.
    std::optional<std::string> attributeByLocalName(const std::string &localName) const;

    /// Number of currently open elements.
    size_t depth() const { return open_; }

private:
    struct Attribute
    {
        std::string name;
        std::string localName;
        std::string value;
    };

    void readElement();
    [[noreturn]] void fail() const;

    const std::string &xml_;
    std::unique_ptr<xmlTextReader, void (*)(xmlTextReaderPtr)> reader_;
    Token token_ = Token::End;
    std::string name_;
    std::string localName_;
    std::string text_;
    std::vector<Attribute> attributes_;
    size_t open_ = 0;
    bool pendingEnd_ = false;
    bool finished_ = false;
};

} // namespace extract
} // namespace docsanitizer

#endif // DOCSANITIZER_EXTRACT_XML_READER_HPP
