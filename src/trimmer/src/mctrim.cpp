#include "mctrim/core/logger.h"
#include "mctrim/trimmer/arg-options.h"
#include "mctrim/trimmer/criteria.h"
#include "mctrim/trimmer/dimension-paths.h"
#include "mctrim/trimmer/region-trimmer.h"
#include "mctrim/trimmer/trimmer-errors.h"
#include <boost/filesystem.hpp>
#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

using namespace mctrim::trimmer;
namespace fs = boost::filesystem;

int
main(int argc, char* argv[])
{
    CommandLineOptions options = parse_argv(argc, argv);

    // Display help if requested or if there was a parsing error
    if (options.show_help || !options.valid)
    {
        if (!options.valid && options.error_message)
        {
            std::cerr << "Error: " << *options.error_message << std::endl
                      << std::endl;
        }
        std::cout << options.help_text << std::endl;
        return options.valid ? 0 : 1;
    }

    try
    {
        if (!Logger::set_level(options.log_level))
        {
            Logger::set_level(LogLevel::INFO);
            std::cerr << "Unrecognized log level: " << options.log_level
                      << ", falling back to 'info'" << std::endl;
        }

        const fs::path input(*options.input_dir);
        const fs::path output =
            options.output_dir ? fs::path(*options.output_dir) : input;
        std::optional<fs::path> backup;
        if (options.backup_dir)
        {
            backup = fs::path(*options.backup_dir);
        }

        // Validated by parse_argv
        std::optional<TrimCriterion> criterion =
            find_criterion(*options.criterion);
        if (!criterion)
        {
            throw ConfigurationError(
                "Unknown criterion: " + *options.criterion);
        }

        DimensionPaths paths(input, output, backup);
        RegionTrimmer trimmer(std::move(paths), *criterion, options.fail_fast);

        auto start_time = std::chrono::steady_clock::now();
        BatchReport report = trimmer.run(options.parallel.value_or(1));
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        log_report(report);
        LOGI("Finished in ", duration.count() / 1000.0, " seconds");

        return report.ok() ? 0 : 1;
    }
    catch (const ConfigurationError& e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
