#include "mctrim/trimmer/arg-options.h"
#include "mctrim/trimmer/criteria.h"

#include <boost/program_options.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace po = boost::program_options;
namespace mctrim::trimmer {

namespace {

std::size_t
default_worker_count()
{
    const unsigned int cores = std::thread::hardware_concurrency();
    return cores > 1 ? cores - 1 : 1;
}

std::string
joined_criteria()
{
    std::string joined;
    for (const auto& name : criterion_names())
    {
        if (!joined.empty())
            joined += ", ";
        joined += name;
    }
    return joined;
}

}  // namespace

CommandLineOptions
parse_argv(int argc, char* argv[])
{
    CommandLineOptions options;

    const std::string criteria_list = joined_criteria();

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "input-region,i",
        po::value<std::string>(),
        "Dimension directory to read region/, poi/ and entities/ from. "
        "Without an output directory the files are edited in place")(
        "output-region,o",
        po::value<std::string>(),
        "Dimension directory to write to (default: the input directory)")(
        "backup,b",
        po::value<std::string>()->implicit_value("./backup"),
        "Copy files affected by trimming to this directory first "
        "(bare flag: ./backup)")(
        "parallel,p",
        po::value<std::size_t>()->implicit_value(default_worker_count()),
        "Process files on this many worker threads "
        "(bare flag: CPU cores - 1)")(
        "criteria,c",
        po::value<std::string>(),
        ("Criterion deciding which chunks are trimmed: " + criteria_list)
            .c_str())(
        "fail-fast",
        po::bool_switch(),
        "Stop a worker's remaining files after its first failure")(
        "log-level,l",
        po::value<std::string>()->default_value("info"),
        "Log level (error, warn, info, debug)");

    std::ostringstream help_stream;
    help_stream
        << "Region Trimmer" << std::endl
        << "--------------" << std::endl
        << "Deletes chunks matching a retention criterion from region files "
           "and rewrites them compactly"
        << std::endl
        << std::endl
        << "Usage: " << (argc > 0 ? argv[0] : "mctrim")
        << " -i <dimension_dir> -c <criterion> [options]" << std::endl
        << desc << std::endl
        << "Examples:" << std::endl
        << "  Trim chunks visited for less than a minute, in place:"
        << std::endl
        << "    mctrim -i world -c 'inhabited_time<1m' -b" << std::endl
        << "  Write to a copy using 4 worker threads:" << std::endl
        << "    mctrim -i world -o world-trimmed -c 'inhabited_time<5m' "
           "--parallel=4"
        << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("input-region"))
        {
            options.input_dir = vm["input-region"].as<std::string>();
        }
        else
        {
            options.valid = false;
            options.error_message = "No input directory specified";
            return options;
        }

        if (vm.count("criteria"))
        {
            const std::string name = vm["criteria"].as<std::string>();
            if (!find_criterion(name))
            {
                options.valid = false;
                options.error_message = "Unknown criterion '" + name +
                    "' (choose from " + criteria_list + ")";
                return options;
            }
            options.criterion = name;
        }
        else
        {
            options.valid = false;
            options.error_message = "No trimming criterion specified";
            return options;
        }

        if (vm.count("output-region"))
        {
            options.output_dir = vm["output-region"].as<std::string>();
        }

        if (vm.count("backup"))
        {
            options.backup_dir = vm["backup"].as<std::string>();
        }

        if (vm.count("parallel"))
        {
            const std::size_t workers = vm["parallel"].as<std::size_t>();
            if (workers == 0)
            {
                options.valid = false;
                options.error_message = "Worker count must be at least 1";
                return options;
            }
            options.parallel = workers;
        }

        options.fail_fast = vm["fail-fast"].as<bool>();
        options.log_level = vm["log-level"].as<std::string>();
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }
    catch (const std::exception& e)
    {
        options.valid = false;
        options.error_message = std::string("Unexpected error: ") + e.what();
    }

    return options;
}

}  // namespace mctrim::trimmer
