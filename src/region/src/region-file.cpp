#include "mctrim/region/region-file.h"
#include "mctrim/region/container-io.h"

namespace mctrim::region {

RegionFile::RegionFile(const uint8_t* data, std::size_t size)
    : SlotContainer<ChunkRecord>(data, size, SlotRetention::DENSE)
{
}

RegionFile::RegionFile(const std::vector<uint8_t>& data)
    : RegionFile(data.data(), data.size())
{
}

RegionFile
RegionFile::from_file(const std::string& path)
{
    return RegionFile(read_container_file(path));
}

}  // namespace mctrim::region
