#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mctrim::region {

enum class SaveOutcome {
    WRITTEN,  // container bytes written to the target path
    REMOVED   // nothing survived; the target path no longer exists
};

/**
 * Read a whole container file into memory
 *
 * @throws ContainerIOError if the file cannot be opened or read
 */
std::vector<uint8_t>
read_container_file(const std::string& path);

/**
 * Store a serialized container.
 *
 * Images no larger than the two tables hold no records: nothing is written
 * and an existing file at path is deleted. Otherwise the bytes go to a
 * sibling temporary file which is then renamed over path, so a failed write
 * never leaves a partial container behind.
 *
 * @throws ContainerIOError on any filesystem failure
 */
SaveOutcome
write_container_file(
    const std::string& path,
    const std::vector<uint8_t>& bytes);

}  // namespace mctrim::region
