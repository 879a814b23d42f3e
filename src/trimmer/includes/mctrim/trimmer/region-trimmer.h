#pragma once

#include <boost/filesystem.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "mctrim/core/logger.h"
#include "mctrim/trimmer/criteria.h"
#include "mctrim/trimmer/dimension-paths.h"

namespace mctrim::trimmer {

enum class FileStatus {
    UNCHANGED,  // nothing matched; passed through to the output
    TRIMMED,    // chunks removed, compacted container written
    REMOVED,    // every chunk removed, output file deleted
    FAILED,     // load, trim or save raised; no output for this file
    SKIPPED     // not attempted after an earlier failure (fail-fast)
};

const char*
to_string(FileStatus status);

struct FileOutcome
{
    std::string name;
    FileStatus status = FileStatus::UNCHANGED;
    std::size_t chunks_trimmed = 0;
    // entities/poi files rewritten to follow the region
    std::size_t companions_updated = 0;
    std::string error;
};

struct BatchReport
{
    std::vector<FileOutcome> outcomes;
    // Workers that stopped on something other than a per-file error
    std::vector<std::string> worker_errors;

    std::size_t
    count(FileStatus status) const;

    std::size_t
    chunks_trimmed() const;

    bool
    ok() const
    {
        return worker_errors.empty() && count(FileStatus::FAILED) == 0;
    }

    void
    merge(BatchReport&& other);
};

/**
 * Drives load -> trim -> backup -> save for the region files of one
 * dimension.
 *
 * Each region file is handled on its own; nothing is shared between files,
 * so disjoint file lists can run on separate threads. Every container
 * involved in one file (the region plus its entities/poi companions) is
 * decoded and trimmed in memory before the first write, and a backup copy
 * always precedes the save it protects.
 */
class RegionTrimmer
{
public:
    RegionTrimmer(
        DimensionPaths paths,
        TrimCriterion criterion,
        bool fail_fast = false);

    /**
     * Process one region file and its companions
     *
     * @throws region::ContainerError or boost::filesystem::filesystem_error
     */
    FileOutcome
    process_region(const boost::filesystem::path& region) const;

    /**
     * Process a list sequentially. Failures are recorded per file; with
     * fail-fast the rest of the list is reported as skipped.
     */
    BatchReport
    process_batch(const std::vector<boost::filesystem::path>& regions) const;

    /**
     * Enumerate the input region directory and process it with the given
     * number of worker threads (1 runs on the calling thread)
     */
    BatchReport
    run(std::size_t workers) const;

    BatchReport
    run(const std::vector<boost::filesystem::path>& regions,
        std::size_t workers) const;

    static LogPartition&
    get_log_partition();

private:
    DimensionPaths paths_;
    TrimCriterion criterion_;
    bool fail_fast_;
};

/**
 * Split files into workers lists, file i going to list i % workers
 */
std::vector<std::vector<boost::filesystem::path>>
partition_round_robin(
    const std::vector<boost::filesystem::path>& files,
    std::size_t workers);

void
log_report(const BatchReport& report);

}  // namespace mctrim::trimmer
