#pragma once

#include <boost/filesystem.hpp>
#include <optional>
#include <vector>

namespace mctrim::trimmer {

// Container kinds stored side by side in a dimension directory
enum class ContainerKind { REGION, POI, ENTITIES };

const char*
container_subdirectory(ContainerKind kind);

/**
 * Input/output/backup layout of one dimension.
 *
 * Each root holds region/, poi/ and entities/ subdirectories, which are
 * created on construction. Output may equal input (in-place rewrite);
 * backup must differ from both.
 */
class DimensionPaths
{
public:
    /**
     * @throws ConfigurationError if backup equals input or output, or the
     * input directory does not exist
     */
    DimensionPaths(
        boost::filesystem::path input,
        boost::filesystem::path output,
        std::optional<boost::filesystem::path> backup = std::nullopt);

    boost::filesystem::path
    input(ContainerKind kind) const;

    boost::filesystem::path
    output(ContainerKind kind) const;

    // Empty when no backup directory was configured
    std::optional<boost::filesystem::path>
    backup(ContainerKind kind) const;

    bool
    in_place() const
    {
        return in_place_;
    }

private:
    boost::filesystem::path input_;
    boost::filesystem::path output_;
    std::optional<boost::filesystem::path> backup_;
    bool in_place_;
};

/**
 * Container files (*.mca) directly inside dir, sorted by name
 *
 * @throws ConfigurationError if dir does not exist or is not a directory
 */
std::vector<boost::filesystem::path>
list_containers(const boost::filesystem::path& dir);

/**
 * Copy file into backup_dir, keeping permissions and modification time and
 * replacing an older backup of the same name
 *
 * @throws boost::filesystem::filesystem_error on failure
 */
boost::filesystem::path
backup_copy(
    const boost::filesystem::path& file,
    const boost::filesystem::path& backup_dir);

// Plain copy used for untouched containers, metadata preserved the same way
void
passthrough_copy(
    const boost::filesystem::path& from,
    const boost::filesystem::path& to);

}  // namespace mctrim::trimmer
