#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace mctrim::trimmer {

/**
 * Type-safe structure for command line options
 */
struct CommandLineOptions
{
    /** Dimension directory holding region/, poi/ and entities/ */
    std::optional<std::string> input_dir;

    /** Output dimension directory; defaults to the input (in-place) */
    std::optional<std::string> output_dir;

    /** Where affected files are copied before being rewritten */
    std::optional<std::string> backup_dir;

    /** Worker thread count; unset means sequential processing */
    std::optional<std::size_t> parallel;

    /** Name of the retention criterion (see criterion_names()) */
    std::optional<std::string> criterion;

    /** Stop a worker's remaining files after its first failure */
    bool fail_fast = false;

    /** Log verbosity level */
    std::string log_level = "info";

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse command line arguments into a structured options object
 *
 * @param argc Argument count from main
 * @param argv Argument values from main
 * @return A populated CommandLineOptions structure
 */
CommandLineOptions
parse_argv(int argc, char* argv[]);

}  // namespace mctrim::trimmer
