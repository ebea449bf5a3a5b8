//
// In-memory zip construction on top of libarchive
//

#include "ZipArchive.h"
#include "../Lib/Exceptions.h"
#include "../Settings.h"
#include <archive_entry.h>
#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <ctime>
#include <stdexcept>
#include <utility>

ZipArchive::ZipArchive() : writer(archive_write_new()), output(std::make_unique<std::vector<uint8_t>>())
{
    if (writer == nullptr) {
        throw eStorageError("Unable to allocate a zip writer");
    }

    try {
        check(archive_write_set_format_zip(writer), "select the zip format");

        // Zip readers expect the archive to end at the central directory, so don't pad the final block
        check(archive_write_set_bytes_in_last_block(writer, 1), "disable block padding");

        check(archive_write_open(writer, output.get(), nullptr, &ZipArchive::writeCallback, nullptr),
              "open the in-memory zip");
    } catch (...) {
        release();
        throw;
    }
}

ZipArchive::~ZipArchive()
{
    release();
}

ZipArchive::ZipArchive(ZipArchive&& other) noexcept
    : writer(std::exchange(other.writer, nullptr)), output(std::move(other.output)), entries(other.entries)
{}

auto ZipArchive::operator=(ZipArchive&& other) noexcept -> ZipArchive&
{
    if (this != &other) {
        release();
        writer = std::exchange(other.writer, nullptr);
        output = std::move(other.output);
        entries = other.entries;
    }
    return *this;
}

void ZipArchive::addFile(const std::string& relativePath, const boost::filesystem::path& file)
{
    if (writer == nullptr) {
        throw std::logic_error("Zip archive has already been finished");
    }

    boost::filesystem::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw eStorageError("Failed to read file: " + file.string());
    }

    boost::system::error_code errorCode;
    auto fileSize = boost::filesystem::file_size(file, errorCode);
    auto modified = errorCode ? std::time_t{} : boost::filesystem::last_write_time(file, errorCode);
    if (errorCode) {
        throw eStorageError("Failed to stat file " + file.string() + ": " + errorCode.message());
    }

    // Owned by a unique_ptr so an exception part way through doesn't leak the entry
    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), &archive_entry_free);
    archive_entry_set_pathname(entry.get(), relativePath.c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(fileSize));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_mtime(entry.get(), modified, 0);

    check(archive_write_header(writer, entry.get()), "add " + relativePath + " to .zip");

    std::vector<char> chunk(UPLOAD_CHUNK_SIZE);
    while (input) {
        input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        auto count = input.gcount();
        if (count <= 0) {
            break;
        }

        if (archive_write_data(writer, chunk.data(), static_cast<size_t>(count)) < 0) {
            check(ARCHIVE_FATAL, "add file contents to .zip");
        }
    }

    if (input.bad()) {
        throw eStorageError("Failed to read file: " + file.string());
    }

    check(archive_write_finish_entry(writer), "finish the .zip entry for " + relativePath);
    entries++;
}

auto ZipArchive::finish() -> std::vector<uint8_t>
{
    if (writer == nullptr) {
        throw std::logic_error("Zip archive has already been finished");
    }

    check(archive_write_close(writer), "write the zip file");
    release();

    return std::move(*output);
}

auto ZipArchive::writeCallback(struct archive* /*writer*/, void* clientData, const void* buffer, size_t length)
        -> la_ssize_t
{
    auto* destination = static_cast<std::vector<uint8_t>*>(clientData);
    const auto* bytes = static_cast<const uint8_t*>(buffer);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    destination->insert(destination->end(), bytes, bytes + length);
    return static_cast<la_ssize_t>(length);
}

void ZipArchive::check(int result, const std::string& what)
{
    // Warnings (such as a pathname that couldn't be converted exactly) still produce a usable entry
    if (result < ARCHIVE_WARN) {
        const auto* reason = writer != nullptr ? archive_error_string(writer) : nullptr;
        throw eStorageError("Failed to " + what + ": " + (reason != nullptr ? reason : "unknown libarchive error"));
    }
}

void ZipArchive::release()
{
    if (writer != nullptr) {
        archive_write_free(writer);
        writer = nullptr;
    }
}
