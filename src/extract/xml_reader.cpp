#include "extract/xml_reader.hpp"

#include <climits>
#include <libxml/parser.h>
#include <libxml/xmlerror.h>

namespace docsanitizer {
namespace extract {

namespace {

std::string fromXml(const xmlChar *s)
{
    return s ? std::string(reinterpret_cast<const char *>(s)) : std::string();
}

void initLibxml()
{
    // xmlInitParser must run once before readers are used from several threads.
    static const bool initialized = (xmlInitParser(), true);
    (void)initialized;
}

constexpr int kParseOptions = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

} // namespace

XmlReader::XmlReader(const std::string &xml)
    : xml_(xml)
    , reader_(nullptr, &xmlFreeTextReader)
{
    if (xml_.empty()) {
        throw XmlError("empty document");
    }
    if (xml_.size() > static_cast<size_t>(INT_MAX)) {
        throw XmlError("document too large");
    }
    initLibxml();
    xmlResetLastError();
    reader_.reset(xmlReaderForMemory(xml_.data(), static_cast<int>(xml_.size()), nullptr, nullptr, kParseOptions));
    if (!reader_) {
        throw XmlError("cannot create reader");
    }
}

void XmlReader::fail() const
{
    std::string message = "malformed document";
    const xmlError *error = xmlGetLastError();
    if (error && error->message) {
        std::string detail = error->message;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == ' ')) {
            detail.pop_back();
        }
        message += " (" + detail + ")";
    }
    message += " near line " + std::to_string(xmlTextReaderGetParserLineNumber(reader_.get()));
    throw XmlError(message);
}

void XmlReader::readElement()
{
    xmlTextReaderPtr reader = reader_.get();
    name_ = fromXml(xmlTextReaderConstName(reader));
    localName_ = fromXml(xmlTextReaderConstLocalName(reader));
    text_.clear();
    pendingEnd_ = xmlTextReaderIsEmptyElement(reader) == 1;

    attributes_.clear();
    if (xmlTextReaderHasAttributes(reader) != 1) {
        return;
    }
    for (int rc = xmlTextReaderMoveToFirstAttribute(reader); rc == 1; rc = xmlTextReaderMoveToNextAttribute(reader)) {
        if (xmlTextReaderIsNamespaceDecl(reader) == 1) {
            continue;
        }
        attributes_.push_back(Attribute{fromXml(xmlTextReaderConstName(reader)),
                                        fromXml(xmlTextReaderConstLocalName(reader)),
                                        fromXml(xmlTextReaderConstValue(reader))});
    }
    xmlTextReaderMoveToElement(reader);
}

XmlReader::Token XmlReader::next()
{
    if (pendingEnd_) {
        pendingEnd_ = false;
        attributes_.clear();
        --open_;
        return token_ = Token::EndElement;
    }
    if (finished_) {
        return token_ = Token::End;
    }

    for (;;) {
        int rc = xmlTextReaderRead(reader_.get());
        if (rc < 0) {
            fail();
        }
        if (rc == 0) {
            finished_ = true;
            return token_ = Token::End;
        }

        switch (xmlTextReaderNodeType(reader_.get())) {
        case XML_READER_TYPE_ELEMENT:
            readElement();
            ++open_;
            return token_ = Token::StartElement;
        case XML_READER_TYPE_END_ELEMENT:
            name_ = fromXml(xmlTextReaderConstName(reader_.get()));
            localName_ = fromXml(xmlTextReaderConstLocalName(reader_.get()));
            attributes_.clear();
            text_.clear();
            if (open_ > 0) {
                --open_;
            }
            return token_ = Token::EndElement;
        case XML_READER_TYPE_TEXT:
        case XML_READER_TYPE_CDATA:
        case XML_READER_TYPE_WHITESPACE:
        case XML_READER_TYPE_SIGNIFICANT_WHITESPACE:
            text_ = fromXml(xmlTextReaderConstValue(reader_.get()));
            return token_ = Token::Text;
        default:
            break;
        }
    }
}

std::optional<std::string> XmlReader::attribute(const std::string &qualifiedName) const
{
    for (const auto &attr : attributes_) {
        if (attr.name == qualifiedName) {
            return attr.value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> XmlReader::attributeByLocalName(const std::string &localName) const
{
    for (const auto &attr : attributes_) {
        if (attr.localName == localName) {
            return attr.value;
        }
    }
    return std::nullopt;
}

} // namespace extract
} // namespace docsanitizer
