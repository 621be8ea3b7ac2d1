#ifndef DOCSANITIZER_EXTRACT_TEXT_CODEC_HPP
#define DOCSANITIZER_EXTRACT_TEXT_CODEC_HPP

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file text_codec.hpp
 * @brief Character-set and transfer-encoding helpers shared by the extractors.
 *
 * Base64 goes through OpenSSL (EVP_DecodeBlock); everything else is small
 * enough to do by hand.
 */

namespace docsanitizer {
namespace extract {
namespace codec {

bool isValidUtf8(const std::string &text);

std::string latin1ToUtf8(const std::string &text);

/**
 * @brief Bytes to UTF-8 text: strips a UTF-8 BOM, keeps valid UTF-8 as is and
 *        otherwise reads the bytes as Latin-1.
 */
std::string decodeText(const std::vector<uint8_t> &bytes);

/**
 * @brief Split on '\n', dropping a trailing '\r' from each line.
 */
std::vector<std::string> splitLines(const std::string &text);

/**
 * @brief Decode base64, ignoring whitespace.
 * @throw ExtractionError on malformed input.
 */
std::string decodeBase64(const std::string &encoded);

/**
 * @brief Decode a quoted-printable body (RFC 2045), including soft line breaks.
 */
std::string decodeQuotedPrintable(const std::string &encoded);

/**
 * @brief Decode RFC 2047 encoded-words ("=?utf-8?B?...?=") in a header value.
 *        Unknown charsets are passed through undecoded.
 */
std::string decodeHeaderWords(const std::string &value);

/**
 * @brief Make a value safe for a Markdown table cell: '|' is escaped and
 *        line breaks become spaces.
 */
std::string escapeTableCell(const std::string &value);

/**
 * @brief Render one Markdown table row from cells.
 */
std::string markdownRow(const std::vector<std::string> &cells);

/**
 * @brief The "|---|---|" line that follows a Markdown header row.
 */
std::string markdownSeparator(size_t columns);

std::string trimCopy(const std::string &text);

std::string toLowerCopy(const std::string &text);

} // namespace codec
} // namespace extract
} // namespace docsanitizer

#endif // DOCSANITIZER_EXTRACT_TEXT_CODEC_HPP
