#include "extract/format_extractors.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <memory>

#include "extract/sheet_table.hpp"
#include "extract/text_codec.hpp"
#include "extract/xml_reader.hpp"
#include "extract/zip_archive.hpp"
#include "util/logger.hpp"

namespace docsanitizer {
namespace extract {

namespace {

namespace logger = util::logger;

struct SheetRef
{
    std::string name;
    std::string relationshipId;
};

std::vector<SheetRef> readSheetList(const std::string &workbookXml)
{
    std::vector<SheetRef> sheets;
    XmlReader reader(workbookXml);
    while (reader.next() != XmlReader::Token::End) {
        if (reader.token() == XmlReader::Token::StartElement && reader.localName() == "sheet") {
            SheetRef ref;
            ref.name = reader.attribute("name").value_or("Sheet" + std::to_string(sheets.size() + 1));
            ref.relationshipId = reader.attributeByLocalName("id").value_or("");
            sheets.push_back(std::move(ref));
        }
    }
    return sheets;
}

/**
 * Relationship id -> part path inside the package.
 */
std::map<std::string, std::string> readRelationships(const std::string &relsXml)
{
    std::map<std::string, std::string> targets;
    XmlReader reader(relsXml);
    while (reader.next() != XmlReader::Token::End) {
        if (reader.token() == XmlReader::Token::StartElement && reader.localName() == "Relationship") {
            auto id = reader.attribute("Id");
            auto target = reader.attribute("Target");
            if (!id || !target) {
                continue;
            }
            std::string path = *target;
            if (!path.empty() && path[0] == '/') {
                path.erase(0, 1);
            } else {
                path = "xl/" + path;
            }
            targets[*id] = path;
        }
    }
    return targets;
}

/**
 * Shared strings table. Rich-text runs are concatenated; phonetic hints
 * (rPh) are skipped.
 */
std::vector<std::string> readSharedStrings(const std::string &xml)
{
    std::vector<std::string> strings;
    std::string current;
    bool inItem = false;
    bool inText = false;
    int phoneticDepth = 0;

    XmlReader reader(xml);
    while (reader.next() != XmlReader::Token::End) {
        const auto token = reader.token();
        if (token == XmlReader::Token::Text) {
            if (inItem && inText && phoneticDepth == 0) {
                current += reader.text();
            }
            continue;
        }
        const bool start = token == XmlReader::Token::StartElement;
        const std::string local = reader.localName();
        if (local == "si") {
            if (start) {
                inItem = true;
                current.clear();
            } else {
                inItem = false;
                strings.push_back(current);
            }
        } else if (local == "t") {
            inText = start;
        } else if (local == "rPh") {
            phoneticDepth += start ? 1 : -1;
        }
    }
    return strings;
}

/**
 * "BC12" -> 54 (zero-based column). -1 when the reference has no letters.
 * @throw ExtractionError past column XFD.
 */
int columnFromReference(const std::string &ref)
{
    long column = 0;
    size_t i = 0;
    for (; i < ref.size() && std::isalpha(static_cast<unsigned char>(ref[i])); ++i) {
        column = column * 26 + (std::toupper(static_cast<unsigned char>(ref[i])) - 'A' + 1);
        if (column - 1 > sheet::kMaxColumn) {
            throw ExtractionError("cell reference '" + ref + "' is beyond column XFD");
        }
    }
    return i == 0 ? -1 : static_cast<int>(column - 1);
}

sheet::SheetRows readSheetRows(const std::string &xml, const std::vector<std::string> &sharedStrings)
{
    sheet::SheetRows rows;
    std::map<int, std::string> row;
    int column = -1;
    std::string cellType;
    std::string value;
    bool inValue = false;
    bool inInline = false;

    XmlReader reader(xml);
    while (reader.next() != XmlReader::Token::End) {
        const auto token = reader.token();
        if (token == XmlReader::Token::Text) {
            if (inValue || inInline) {
                value += reader.text();
            }
            continue;
        }
        const bool start = token == XmlReader::Token::StartElement;
        const std::string local = reader.localName();

        if (local == "row") {
            if (start) {
                row.clear();
                column = -1;
            } else {
                rows.push_back(std::move(row));
                row.clear();
            }
        } else if (local == "c") {
            if (start) {
                auto ref = reader.attribute("r");
                int parsed = ref ? columnFromReference(*ref) : -1;
                column = parsed >= 0 ? parsed : column + 1;
                if (column > sheet::kMaxColumn) {
                    throw ExtractionError("row has more than " + std::to_string(sheet::kMaxColumn + 1) + " columns");
                }
                cellType = reader.attribute("t").value_or("n");
                value.clear();
            } else {
                std::string display;
                if (cellType == "s") {
                    if (value.empty()) {
                        display.clear();
                    } else {
                        size_t index = 0;
                        try {
                            index = static_cast<size_t>(std::stoul(value));
                        } catch (const std::exception &) {
                            throw ExtractionError("bad shared string index '" + value + "'");
                        }
                        if (index >= sharedStrings.size()) {
                            throw ExtractionError("shared string index " + value + " out of range");
                        }
                        display = sharedStrings[index];
                    }
                } else if (cellType == "b") {
                    display = value == "1" ? "TRUE" : (value.empty() ? "" : "FALSE");
                } else {
                    display = value;
                }
                if (!codec::trimCopy(display).empty()) {
                    row[column] = display;
                }
            }
        } else if (local == "v") {
            inValue = start;
        } else if (local == "is") {
            inInline = start;
        }
    }
    return rows;
}

} // namespace

bool SpreadsheetExtractor::isLegacyWorkbook(const std::vector<uint8_t> &bytes)
{
    // OLE2 compound document signature, the container of BIFF .xls workbooks.
    static const uint8_t kCompoundFileMagic[] = {0xD0, 0xCF, 0x11, 0xE0, 0xA1, 0xB1, 0x1A, 0xE1};
    return bytes.size() >= sizeof(kCompoundFileMagic) &&
           std::equal(std::begin(kCompoundFileMagic), std::end(kCompoundFileMagic), bytes.begin());
}

ExtractedDocument SpreadsheetExtractor::extract(const std::vector<uint8_t> &bytes) const
{
    if (isLegacyWorkbook(bytes)) {
#ifdef DOCSANITIZER_HAVE_LIBXLS
        return extractLegacy(bytes);
#else
        throw ExtractionError("xls: legacy Excel workbooks are not supported by this build (libxls not found)");
#endif
    }

    ExtractedDocument doc;
    doc.mediaKind = mediaKind();

    std::vector<SheetRef> sheets;
    std::map<std::string, std::string> targets;
    std::vector<std::string> sharedStrings;
    std::unique_ptr<ZipArchive> archive;
    try {
        archive = std::make_unique<ZipArchive>(bytes);
        if (!archive->contains("xl/workbook.xml")) {
            throw ExtractionError("xlsx: missing xl/workbook.xml");
        }
        sheets = readSheetList(archive->read("xl/workbook.xml"));
        if (archive->contains("xl/_rels/workbook.xml.rels")) {
            targets = readRelationships(archive->read("xl/_rels/workbook.xml.rels"));
        }
        if (archive->contains("xl/sharedStrings.xml")) {
            sharedStrings = readSharedStrings(archive->read("xl/sharedStrings.xml"));
        }
    } catch (const ZipError &ex) {
        throw ExtractionError(std::string("xlsx: ") + ex.what());
    } catch (const XmlError &ex) {
        throw ExtractionError(std::string("xlsx: ") + ex.what());
    }

    size_t emptySheets = 0;
    for (size_t i = 0; i < sheets.size(); ++i) {
        const SheetRef &ref = sheets[i];
        auto target = targets.find(ref.relationshipId);
        std::string part = target != targets.end() ? target->second
                                                   : "xl/worksheets/sheet" + std::to_string(i + 1) + ".xml";
        try {
            if (!sheet::appendSheet(doc, ref.name, readSheetRows(archive->read(part), sharedStrings))) {
                ++emptySheets;
            }
        } catch (const std::runtime_error &ex) {
            // ZipError, XmlError or ExtractionError: this sheet only.
            logger::warn("[SpreadsheetExtractor] sheet '" + ref.name + "' unreadable: " + ex.what());
            doc.failures.push_back(SegmentFailure{ref.name, ex.what()});
        }
    }

    if (doc.segments.empty() && !doc.failures.empty()) {
        throw ExtractionError("xlsx: no readable sheet (" + doc.failures.front().label + ": " +
                              doc.failures.front().reason + ")");
    }

    doc.metadata["sheet_count"] = std::to_string(sheets.size());
    doc.metadata["empty_sheet_count"] = std::to_string(emptySheets);
    return doc;
}

} // namespace extract
} // namespace docsanitizer
