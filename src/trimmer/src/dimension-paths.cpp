#include "mctrim/trimmer/dimension-paths.h"
#include "mctrim/core/logger.h"
#include "mctrim/trimmer/trimmer-errors.h"

#include <algorithm>
#include <string>
#include <utility>

namespace fs = boost::filesystem;

namespace mctrim::trimmer {

namespace {

constexpr ContainerKind ALL_KINDS[] = {
    ContainerKind::REGION,
    ContainerKind::POI,
    ContainerKind::ENTITIES};

bool
same_location(const fs::path& a, const fs::path& b)
{
    return fs::weakly_canonical(fs::absolute(a)) ==
        fs::weakly_canonical(fs::absolute(b));
}

void
create_layout(const fs::path& root)
{
    for (ContainerKind kind : ALL_KINDS)
    {
        fs::create_directories(root / container_subdirectory(kind));
    }
}

void
copy_metadata(const fs::path& from, const fs::path& to)
{
    fs::permissions(to, fs::status(from).permissions());
    fs::last_write_time(to, fs::last_write_time(from));
}

}  // namespace

const char*
container_subdirectory(ContainerKind kind)
{
    switch (kind)
    {
        case ContainerKind::REGION:
            return "region";
        case ContainerKind::POI:
            return "poi";
        case ContainerKind::ENTITIES:
            return "entities";
    }
    return "region";
}

DimensionPaths::DimensionPaths(
    fs::path input,
    fs::path output,
    std::optional<fs::path> backup)
    : input_(std::move(input))
    , output_(std::move(output))
    , backup_(std::move(backup))
    , in_place_(false)
{
    if (backup_ && same_location(*backup_, input_))
    {
        throw ConfigurationError(
            "Input and backup directories cannot be the same.");
    }
    if (backup_ && same_location(*backup_, output_))
    {
        throw ConfigurationError(
            "Output and backup directories cannot be the same.");
    }
    if (!fs::exists(input_) || !fs::is_directory(input_))
    {
        throw ConfigurationError(
            "Input directory must exist: " + input_.string());
    }

    in_place_ = same_location(input_, output_);

    create_layout(input_);
    create_layout(output_);
    if (backup_)
    {
        create_layout(*backup_);
    }

    LOGD(
        "Dimension layout: input ",
        input_.string(),
        ", output ",
        output_.string(),
        in_place_ ? " (in place)" : "",
        ", backup ",
        backup_ ? backup_->string() : std::string("<none>"));
}

fs::path
DimensionPaths::input(ContainerKind kind) const
{
    return input_ / container_subdirectory(kind);
}

fs::path
DimensionPaths::output(ContainerKind kind) const
{
    return output_ / container_subdirectory(kind);
}

std::optional<fs::path>
DimensionPaths::backup(ContainerKind kind) const
{
    if (!backup_)
        return std::nullopt;
    return *backup_ / container_subdirectory(kind);
}

std::vector<fs::path>
list_containers(const fs::path& dir)
{
    if (!fs::exists(dir) || !fs::is_directory(dir))
    {
        throw ConfigurationError("Invalid input <" + dir.string() + ">");
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir))
    {
        if (fs::is_regular_file(entry.status()) &&
            entry.path().extension() == ".mca")
        {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

fs::path
backup_copy(const fs::path& file, const fs::path& backup_dir)
{
    fs::path target = backup_dir / file.filename();
    fs::copy_file(file, target, fs::copy_options::overwrite_existing);
    copy_metadata(file, target);
    LOGD("Backed up ", file.string(), " to ", target.string());
    return target;
}

void
passthrough_copy(const fs::path& from, const fs::path& to)
{
    fs::copy_file(from, to, fs::copy_options::overwrite_existing);
    copy_metadata(from, to);
}

}  // namespace mctrim::trimmer
