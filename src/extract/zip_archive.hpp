#ifndef DOCSANITIZER_EXTRACT_ZIP_ARCHIVE_HPP
#define DOCSANITIZER_EXTRACT_ZIP_ARCHIVE_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <zip.h>

/**
 * @file zip_archive.hpp
 * @brief Read-only view of an in-memory ZIP container (the OOXML package
 *        format used by .docx and .xlsx), backed by libzip.
 *
 * The archive is opened with consistency checks, and every entry read to the
 * end is CRC-verified by libzip. Encrypted entries are rejected.
 */

namespace docsanitizer {
namespace extract {

class ZipError : public std::runtime_error
{
public:
    explicit ZipError(const std::string &message)
        : std::runtime_error("zip: " + message)
    {
    }
};

class ZipArchive
{
public:
    static constexpr uint64_t kDefaultMaxEntryBytes = 64ull * 1024 * 1024;

    /**
     * @brief Open the archive held in @p data.
     *
     * libzip reads @p data in place, so it must outlive the archive.
     * @throw ZipError if @p data is not a readable ZIP archive.
     */
    explicit ZipArchive(const std::vector<uint8_t> &data, uint64_t maxEntryBytes = kDefaultMaxEntryBytes);

    bool contains(const std::string &name) const;

    std::vector<std::string> entryNames() const;

    /**
     * @brief Decompressed contents of an entry.
     * @throw ZipError if the entry is missing, corrupt, encrypted or too large.
     */
    std::string read(const std::string &name) const;

private:
    std::string lastError() const;

    std::unique_ptr<zip_t, void (*)(zip_t *)> archive_;
    uint64_t maxEntryBytes_;
};

} // namespace extract
} // namespace docsanitizer

#endif // DOCSANITIZER_EXTRACT_ZIP_ARCHIVE_HPP
