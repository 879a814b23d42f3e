#include "mctrim/trimmer/region-trimmer.h"
#include "mctrim/region/entities-file.h"
#include "mctrim/region/region-errors.h"
#include "mctrim/region/region-file.h"

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace fs = boost::filesystem;

namespace mctrim::trimmer {

using region::EntitiesFile;
using region::RegionFile;
using region::SaveOutcome;

namespace {

// entities/ and poi/ files are keyed by the same region coordinates
constexpr ContainerKind COMPANION_KINDS[] = {
    ContainerKind::ENTITIES,
    ContainerKind::POI};

struct PendingCompanion
{
    ContainerKind kind;
    fs::path input;
    fs::path output;
    std::optional<EntitiesFile> file;
};

}  // namespace

const char*
to_string(FileStatus status)
{
    switch (status)
    {
        case FileStatus::UNCHANGED:
            return "unchanged";
        case FileStatus::TRIMMED:
            return "trimmed";
        case FileStatus::REMOVED:
            return "removed";
        case FileStatus::FAILED:
            return "failed";
        case FileStatus::SKIPPED:
            return "skipped";
    }
    return "unknown";
}

std::size_t
BatchReport::count(FileStatus status) const
{
    return std::count_if(
        outcomes.begin(), outcomes.end(), [status](const FileOutcome& o) {
            return o.status == status;
        });
}

std::size_t
BatchReport::chunks_trimmed() const
{
    std::size_t total = 0;
    for (const auto& outcome : outcomes)
    {
        total += outcome.chunks_trimmed;
    }
    return total;
}

void
BatchReport::merge(BatchReport&& other)
{
    outcomes.insert(
        outcomes.end(),
        std::make_move_iterator(other.outcomes.begin()),
        std::make_move_iterator(other.outcomes.end()));
    worker_errors.insert(
        worker_errors.end(),
        std::make_move_iterator(other.worker_errors.begin()),
        std::make_move_iterator(other.worker_errors.end()));
}

RegionTrimmer::RegionTrimmer(
    DimensionPaths paths,
    TrimCriterion criterion,
    bool fail_fast)
    : paths_(std::move(paths))
    , criterion_(std::move(criterion))
    , fail_fast_(fail_fast)
{
}

LogPartition&
RegionTrimmer::get_log_partition()
{
    static LogPartition partition("TRIM");
    return partition;
}

FileOutcome
RegionTrimmer::process_region(const fs::path& region_path) const
{
    const fs::path name = region_path.filename();
    FileOutcome outcome;
    outcome.name = name.string();

    // Loaded -> Trimmed
    RegionFile region = RegionFile::from_file(region_path.string());
    outcome.chunks_trimmed = region.trim(criterion_.predicate());

    std::vector<PendingCompanion> companions;
    for (ContainerKind kind : COMPANION_KINDS)
    {
        PendingCompanion companion{
            kind, paths_.input(kind) / name, paths_.output(kind) / name, {}};
        if (!fs::exists(companion.input))
            continue;

        if (region.dirty())
        {
            companion.file.emplace(
                EntitiesFile::from_file(companion.input.string()));
            companion.file->remove_slots(region.cleared_indices());
        }
        companions.push_back(std::move(companion));
    }

    const fs::path region_out = paths_.output(ContainerKind::REGION) / name;
    if (region.dirty())
    {
        if (auto backup_dir = paths_.backup(ContainerKind::REGION))
        {
            backup_copy(region_path, *backup_dir);
        }

        SaveOutcome saved = region.save_to_file(region_out.string());
        outcome.status = saved == SaveOutcome::WRITTEN ? FileStatus::TRIMMED
                                                       : FileStatus::REMOVED;
        OLOGI(
            outcome.name,
            ": trimmed ",
            outcome.chunks_trimmed,
            " chunks, ",
            region.populated_count(),
            " left");
    }
    else
    {
        if (!paths_.in_place())
        {
            passthrough_copy(region_path, region_out);
        }
        OLOGD(outcome.name, ": nothing to trim");
    }

    for (auto& companion : companions)
    {
        if (companion.file && companion.file->dirty())
        {
            if (auto backup_dir = paths_.backup(companion.kind))
            {
                backup_copy(companion.input, *backup_dir);
            }
            companion.file->save_to_file(companion.output.string());
            ++outcome.companions_updated;
            OLOGD(
                outcome.name,
                ": rewrote ",
                container_subdirectory(companion.kind),
                " companion");
        }
        else if (!paths_.in_place())
        {
            passthrough_copy(companion.input, companion.output);
        }
    }

    return outcome;
}

BatchReport
RegionTrimmer::process_batch(const std::vector<fs::path>& regions) const
{
    BatchReport report;
    for (std::size_t i = 0; i < regions.size(); ++i)
    {
        const fs::path& region_path = regions[i];
        FileOutcome failed;
        failed.name = region_path.filename().string();
        failed.status = FileStatus::FAILED;

        try
        {
            report.outcomes.push_back(process_region(region_path));
            continue;
        }
        catch (const region::ContainerIOError& e)
        {
            failed.error = std::string("I/O error: ") + e.what();
        }
        catch (const region::ContainerError& e)
        {
            failed.error = std::string("Format error: ") + e.what();
        }
        catch (const fs::filesystem_error& e)
        {
            failed.error = std::string("Filesystem error: ") + e.what();
        }
        catch (const std::exception& e)
        {
            failed.error = std::string("Error: ") + e.what();
        }

        OLOGE(failed.name, ": ", failed.error);
        report.outcomes.push_back(std::move(failed));

        if (fail_fast_)
        {
            for (std::size_t j = i + 1; j < regions.size(); ++j)
            {
                FileOutcome skipped;
                skipped.name = regions[j].filename().string();
                skipped.status = FileStatus::SKIPPED;
                report.outcomes.push_back(std::move(skipped));
            }
            OLOGW(
                "Stopping after failure, ",
                regions.size() - i - 1,
                " files skipped");
            break;
        }
    }
    return report;
}

BatchReport
RegionTrimmer::run(std::size_t workers) const
{
    return run(list_containers(paths_.input(ContainerKind::REGION)), workers);
}

BatchReport
RegionTrimmer::run(const std::vector<fs::path>& regions, std::size_t workers)
    const
{
    OLOGI(
        "Processing ",
        regions.size(),
        " region files with criterion ",
        criterion_.name(),
        " on ",
        std::max<std::size_t>(workers, 1),
        " worker(s)");

    if (workers <= 1)
    {
        return process_batch(regions);
    }

    auto work = partition_round_robin(regions, workers);
    std::vector<BatchReport> reports(work.size());
    std::vector<std::thread> threads;
    threads.reserve(work.size());

    for (std::size_t w = 0; w < work.size(); ++w)
    {
        if (work[w].empty())
            continue;

        threads.emplace_back([this, w, &work, &reports]() {
            Logger::set_thread_label("worker-" + std::to_string(w));
            try
            {
                reports[w] = process_batch(work[w]);
            }
            catch (const std::exception& e)
            {
                reports[w].worker_errors.push_back(
                    "worker-" + std::to_string(w) + ": " + e.what());
                LOGE("Worker ", w, " aborted: ", e.what());
            }
        });
    }

    for (auto& thread : threads)
    {
        thread.join();
    }

    BatchReport merged;
    for (auto& report : reports)
    {
        merged.merge(std::move(report));
    }
    return merged;
}

std::vector<std::vector<fs::path>>
partition_round_robin(const std::vector<fs::path>& files, std::size_t workers)
{
    const std::size_t lists = std::max<std::size_t>(workers, 1);
    std::vector<std::vector<fs::path>> work(lists);
    for (std::size_t i = 0; i < files.size(); ++i)
    {
        work[i % lists].push_back(files[i]);
    }
    return work;
}

void
log_report(const BatchReport& report)
{
    LOGI(
        "Processed ",
        report.outcomes.size(),
        " region files: ",
        report.count(FileStatus::TRIMMED),
        " trimmed, ",
        report.count(FileStatus::REMOVED),
        " removed, ",
        report.count(FileStatus::UNCHANGED),
        " unchanged, ",
        report.count(FileStatus::FAILED),
        " failed, ",
        report.count(FileStatus::SKIPPED),
        " skipped (",
        report.chunks_trimmed(),
        " chunks trimmed)");

    for (const auto& outcome : report.outcomes)
    {
        if (outcome.status == FileStatus::FAILED)
        {
            LOGE("  ", outcome.name, ": ", outcome.error);
        }
    }
    for (const auto& error : report.worker_errors)
    {
        LOGE("  ", error);
    }
}

}  // namespace mctrim::trimmer
