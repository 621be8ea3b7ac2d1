#ifndef DOCSANITIZER_CORE_MEDIA_KIND_HPP
#define DOCSANITIZER_CORE_MEDIA_KIND_HPP

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace docsanitizer {
namespace core {

/**
 * @brief Document formats the extractor knows how to read.
 */
enum class MediaKind {
    PlainText,
    Word,
    Pdf,
    Spreadsheet,
    DelimitedText,
    Email
};

/**
 * @brief Short canonical name, also used as "source_type" in output frontmatter.
 */
inline const char *mediaKindName(MediaKind kind)
{
    switch (kind) {
    case MediaKind::PlainText:
        return "text";
    case MediaKind::Word:
        return "docx";
    case MediaKind::Pdf:
        return "pdf";
    case MediaKind::Spreadsheet:
        return "xlsx";
    case MediaKind::DelimitedText:
        return "csv";
    case MediaKind::Email:
        return "email";
    }
    return "unknown";
}

inline std::vector<MediaKind> allMediaKinds()
{
    return {MediaKind::PlainText, MediaKind::Word,          MediaKind::Pdf,
            MediaKind::Spreadsheet, MediaKind::DelimitedText, MediaKind::Email};
}

/**
 * @brief Parse a canonical name as returned by mediaKindName().
 * @throw std::invalid_argument if unknown.
 */
inline MediaKind parseMediaKind(const std::string &name)
{
    for (MediaKind kind : allMediaKinds()) {
        if (name == mediaKindName(kind)) {
            return kind;
        }
    }
    throw std::invalid_argument("unknown media kind: " + name);
}

/**
 * @brief Map a filename's extension (case-insensitive) to a media kind.
 * @throw std::invalid_argument for unsupported or missing extensions.
 */
inline MediaKind mediaKindFromFilename(const std::string &filename)
{
    auto dot = filename.find_last_of('.');
    auto slash = filename.find_last_of("/\\");
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        throw std::invalid_argument("cannot determine document type of '" + filename + "' (no extension)");
    }
    std::string ext = filename.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".txt")
        return MediaKind::PlainText;
    if (ext == ".docx")
        return MediaKind::Word;
    if (ext == ".pdf")
        return MediaKind::Pdf;
    if (ext == ".xlsx" || ext == ".xls")
        return MediaKind::Spreadsheet;
    if (ext == ".csv")
        return MediaKind::DelimitedText;
    if (ext == ".eml")
        return MediaKind::Email;

    throw std::invalid_argument("unsupported file type: " + ext +
                                ". Supported types: .txt, .docx, .pdf, .xlsx, .xls, .csv, .eml");
}

} // namespace core
} // namespace docsanitizer

#endif // DOCSANITIZER_CORE_MEDIA_KIND_HPP
