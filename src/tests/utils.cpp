#include "utils.h"

#include <archive.h>
#include <archive_entry.h>
#include <boost/property_tree/xml_parser.hpp>
#include <chrono>
#include <memory>

std::shared_ptr<std::default_random_engine> rng =
    nullptr;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

auto randomInt(uint64_t start, uint64_t end) -> uint64_t
{
    if (!rng)
    {
        rng = std::make_shared<std::default_random_engine>(std::chrono::system_clock::now().time_since_epoch().count());
    }

    std::uniform_int_distribution<uint64_t> rng_dist(start, end);
    return rng_dist(*rng);
}

auto generateRandomData(uint32_t count) -> std::shared_ptr<std::vector<uint8_t>>
{
    auto result = std::make_shared<std::vector<uint8_t>>();
    result->reserve(count);

    for (uint32_t i = 0; i < count; i++)
    {
        result->push_back(randomInt(0, std::numeric_limits<uint8_t>::max()));
    }

    return result;
}

namespace
{
    // Walk the zip entries, calling handler with each name and its contents
    template <typename Handler> void forEachZipEntry(const std::vector<uint8_t>& zipData, Handler handler)
    {
        std::unique_ptr<archive, decltype(&archive_read_free)> reader(archive_read_new(), &archive_read_free);
        archive_read_support_format_zip(reader.get());

        if (archive_read_open_memory(reader.get(), zipData.data(), zipData.size()) != ARCHIVE_OK)
        {
            throw std::runtime_error(std::string("Unable to open zip: ") + archive_error_string(reader.get()));
        }

        archive_entry* entry = nullptr;
        while (archive_read_next_header(reader.get(), &entry) == ARCHIVE_OK)
        {
            std::string contents;
            std::vector<char> buffer(4096);  // NOLINT(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

            la_ssize_t count = 0;
            while ((count = archive_read_data(reader.get(), buffer.data(), buffer.size())) > 0)
            {
                contents.append(buffer.data(), static_cast<size_t>(count));
            }

            if (count < 0)
            {
                throw std::runtime_error(std::string("Unable to read zip entry: ") + archive_error_string(reader.get()));
            }

            handler(std::string(archive_entry_pathname(entry)), contents);
        }
    }
}  // namespace

auto readZipEntries(const std::vector<uint8_t>& zipData) -> std::map<std::string, std::string>
{
    std::map<std::string, std::string> entries;
    forEachZipEntry(zipData, [&](const std::string& name, const std::string& contents) {
        entries[name] = contents;
    });
    return entries;
}

auto readZipEntryNames(const std::vector<uint8_t>& zipData) -> std::vector<std::string>
{
    std::vector<std::string> names;
    forEachZipEntry(zipData, [&](const std::string& name, const std::string&) { names.push_back(name); });
    return names;
}

auto parseXml(const std::string& xml) -> boost::property_tree::ptree
{
    std::stringstream stream(xml);
    boost::property_tree::ptree tree;
    boost::property_tree::read_xml(stream, tree, boost::property_tree::xml_parser::trim_whitespace);
    return tree;
}
