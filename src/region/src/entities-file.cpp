#include "mctrim/region/entities-file.h"
#include "mctrim/region/container-io.h"

namespace mctrim::region {

EntitiesFile::EntitiesFile(const uint8_t* data, std::size_t size)
    : SlotContainer<RecordPayload>(data, size, SlotRetention::SPARSE)
{
}

EntitiesFile::EntitiesFile(const std::vector<uint8_t>& data)
    : EntitiesFile(data.data(), data.size())
{
}

EntitiesFile
EntitiesFile::from_file(const std::string& path)
{
    return EntitiesFile(read_container_file(path));
}

std::size_t
EntitiesFile::remove_slots(const std::vector<uint16_t>& indices)
{
    std::size_t removed = 0;
    for (uint16_t index : indices)
    {
        if (remove_slot(index))
            ++removed;
    }
    return removed;
}

}  // namespace mctrim::region
