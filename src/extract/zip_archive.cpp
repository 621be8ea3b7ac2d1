#include "extract/zip_archive.hpp"

namespace docsanitizer {
namespace extract {

namespace {

constexpr size_t kReadBlock = 64 * 1024;

// zip_error_t scoped to a block.
class ScopedZipError
{
public:
    ScopedZipError() { zip_error_init(&error_); }
    ~ScopedZipError() { zip_error_fini(&error_); }

    ScopedZipError(const ScopedZipError &) = delete;
    ScopedZipError &operator=(const ScopedZipError &) = delete;

    zip_error_t *get() { return &error_; }
    std::string message() { return zip_error_strerror(&error_); }

private:
    zip_error_t error_;
};

} // namespace

ZipArchive::ZipArchive(const std::vector<uint8_t> &data, uint64_t maxEntryBytes)
    : archive_(nullptr, &zip_discard)
    , maxEntryBytes_(maxEntryBytes)
{
    // libzip opens a zero-length source as an empty archive.
    if (data.empty()) {
        throw ZipError("empty input");
    }

    ScopedZipError error;
    zip_source_t *source = zip_source_buffer_create(data.data(), data.size(), 0, error.get());
    if (!source) {
        throw ZipError("cannot wrap buffer: " + error.message());
    }
    zip_t *archive = zip_open_from_source(source, ZIP_RDONLY | ZIP_CHECKCONS, error.get());
    if (!archive) {
        zip_source_free(source);
        throw ZipError("not a readable archive: " + error.message());
    }
    archive_.reset(archive);
}

std::string ZipArchive::lastError() const
{
    return zip_strerror(archive_.get());
}

bool ZipArchive::contains(const std::string &name) const
{
    return zip_name_locate(archive_.get(), name.c_str(), 0) >= 0;
}

std::vector<std::string> ZipArchive::entryNames() const
{
    std::vector<std::string> names;
    const zip_int64_t count = zip_get_num_entries(archive_.get(), 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        const char *name = zip_get_name(archive_.get(), static_cast<zip_uint64_t>(i), 0);
        if (name) {
            names.emplace_back(name);
        }
    }
    return names;
}

std::string ZipArchive::read(const std::string &name) const
{
    const zip_int64_t index = zip_name_locate(archive_.get(), name.c_str(), 0);
    if (index < 0) {
        throw ZipError("no entry '" + name + "'");
    }

    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(archive_.get(), static_cast<zip_uint64_t>(index), 0, &st) != 0) {
        throw ZipError("cannot stat '" + name + "': " + lastError());
    }
    if ((st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE) {
        throw ZipError("entry '" + name + "' is encrypted");
    }
    if ((st.valid & ZIP_STAT_SIZE) && st.size > maxEntryBytes_) {
        throw ZipError("entry '" + name + "' is " + std::to_string(st.size) + " bytes, limit " +
                       std::to_string(maxEntryBytes_));
    }

    zip_file_t *file = zip_fopen_index(archive_.get(), static_cast<zip_uint64_t>(index), 0);
    if (!file) {
        throw ZipError("cannot open '" + name + "': " + lastError());
    }

    std::string out;
    if (st.valid & ZIP_STAT_SIZE) {
        out.reserve(static_cast<size_t>(st.size));
    }
    std::vector<char> block(kReadBlock);
    zip_int64_t n = 0;
    while ((n = zip_fread(file, block.data(), block.size())) > 0) {
        out.append(block.data(), static_cast<size_t>(n));
        // Checked against inflated bytes as well as the declared size.
        if (out.size() > maxEntryBytes_) {
            zip_fclose(file);
            throw ZipError("entry '" + name + "' exceeds " + std::to_string(maxEntryBytes_) + " bytes");
        }
    }
    if (n < 0) {
        std::string reason = zip_file_strerror(file);
        zip_fclose(file);
        throw ZipError("corrupt entry '" + name + "': " + reason);
    }
    if (zip_fclose(file) != 0) {
        throw ZipError("corrupt entry '" + name + "': " + lastError());
    }
    return out;
}

} // namespace extract
} // namespace docsanitizer
