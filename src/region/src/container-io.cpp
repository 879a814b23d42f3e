#include "mctrim/region/container-io.h"
#include "mctrim/core/logger.h"
#include "mctrim/region/region-errors.h"
#include "mctrim/region/region-types.h"

#include <boost/filesystem.hpp>
#include <boost/system/error_code.hpp>
#include <fstream>
#include <string>
#include <vector>

namespace fs = boost::filesystem;

namespace mctrim::region {

std::vector<uint8_t>
read_container_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        throw ContainerIOError("Failed to open container file: " + path);
    }

    file.seekg(0, std::ios::end);
    const std::streamsize file_size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (file_size < 0)
    {
        throw ContainerIOError("Failed to determine size of: " + path);
    }

    std::vector<uint8_t> bytes(static_cast<std::size_t>(file_size));
    file.read(reinterpret_cast<char*>(bytes.data()), file_size);
    if (file.gcount() != file_size)
    {
        throw ContainerIOError("Short read from container file: " + path);
    }
    return bytes;
}

SaveOutcome
write_container_file(const std::string& path, const std::vector<uint8_t>& bytes)
{
    if (bytes.size() <= HEADER_SIZE)
    {
        boost::system::error_code ec;
        if (fs::exists(path, ec))
        {
            LOGI("Deleting empty container ", path);
            fs::remove(path, ec);
            if (ec)
            {
                throw ContainerIOError(
                    "Failed to remove " + path + ": " + ec.message());
            }
        }
        return SaveOutcome::REMOVED;
    }

    const std::string temp_path = path + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw ContainerIOError("Failed to open output file: " + temp_path);
        }
        out.write(
            reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out.good())
        {
            out.close();
            boost::system::error_code ignored;
            fs::remove(temp_path, ignored);
            throw ContainerIOError("Failed to write output file: " + temp_path);
        }
    }

    boost::system::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec)
    {
        boost::system::error_code ignored;
        fs::remove(temp_path, ignored);
        throw ContainerIOError(
            "Failed to move " + temp_path + " to " + path + ": " +
            ec.message());
    }

    LOGD("Wrote ", bytes.size(), " bytes to ", path);
    return SaveOutcome::WRITTEN;
}

}  // namespace mctrim::region
