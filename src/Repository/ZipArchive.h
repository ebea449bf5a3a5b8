//
// In-memory zip construction on top of libarchive. Entries are appended in the order they are added and the
// archive is finalized exactly once into a byte buffer.
//

#ifndef STAGING_GATEWAY_ZIPARCHIVE_H
#define STAGING_GATEWAY_ZIPARCHIVE_H

#include <archive.h>
#include <boost/filesystem/path.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class ZipArchive {
public:
    ZipArchive();
    ~ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    auto operator=(const ZipArchive&) -> ZipArchive& = delete;
    ZipArchive(ZipArchive&& other) noexcept;
    auto operator=(ZipArchive&& other) noexcept -> ZipArchive&;

    // Stream the file on disk into a new entry named relativePath
    void addFile(const std::string& relativePath, const boost::filesystem::path& file);

    // Write the central directory and hand over the finished bytes. The archive can't be used afterwards
    auto finish() -> std::vector<uint8_t>;

    [[nodiscard]] auto entryCount() const -> size_t { return entries; }

private:
    static auto writeCallback(struct archive* writer, void* clientData, const void* buffer, size_t length) -> la_ssize_t;
    void check(int result, const std::string& what);
    void release();

    struct archive* writer = nullptr;
    // Heap allocated so the address handed to libarchive survives moves
    std::unique_ptr<std::vector<uint8_t>> output;
    size_t entries = 0;
};

#endif //STAGING_GATEWAY_ZIPARCHIVE_H
