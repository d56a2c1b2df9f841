//
//  CLI front-end for the resumable perceptual hash cache
//

#include <argparse/argparse.hpp>

#include "arguments.hpp"
#include "hash_command.hpp"
#include "logger.hpp"

#include <iostream>
#include <optional>

using namespace phashcache_app;

int main(int argc, char* argv[])
{
    argparse::ArgumentParser program("phashcache", "1.0");
    program.add_description("Compute perceptual hashes for a list of images, resuming from previous runs");
    program.add_epilog("Examples:\n  find photos -name '*.jpg' | phashcache -o hashes.tsv\n"
                       "  phashcache -i list.txt -o hashes.tsv -T 8\n\n"
                       "The output file holds one '<path>\\t<hash>' line per image and is re-read on\n"
                       "subsequent runs so already hashed images are skipped.");

    RawArguments raw;

    program.add_argument("-i", "--input")
        .default_value(std::string(defaults::INPUT))
        .store_into(raw.input)
        .help("File listing one image path per line, or \"-\" to read the list from stdin");

    program.add_argument("-o", "--output")
        .required()
        .store_into(raw.output)
        .help("Output file; re-read on subsequent runs to avoid recomputing phashes");

    program.add_argument("-T", "--threads")
        .default_value(defaults::THREADS)
        .scan<'i', int>()
        .store_into(raw.threads)
        .help("Number of hashing threads (-1 = one per logical core)");

    program.add_argument("-q", "--queue-capacity")
        .default_value(defaults::QUEUE_CAPACITY)
        .scan<'i', int>()
        .store_into(raw.queueCapacity)
        .help("Maximum number of computed hashes waiting to be written");

    program.add_argument("-l", "--log-level")
        .default_value(defaults::LOG_LEVEL)
        .scan<'i', int>()
        .store_into(raw.logLevel)
        .help("Logging verbosity (0=trace, 1=debug, 2=info, 3=warnings, 4=errors only)");

    program.add_argument("--no-progress")
        .implicit_value(true)
        .default_value(defaults::NO_PROGRESS)
        .store_into(raw.noProgress)
        .help("Do not draw the progress bar");

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << '\n';
        std::cerr << program;
        return 1;
    }

    std::optional<Arguments> args;
    try {
        args.emplace(raw);
    }
    catch (const std::invalid_argument& err) {
        std::cerr << err.what() << '\n';
        std::cerr << program;
        return 1;
    }

    phashcache::logger::init(static_cast<phashcache::logger::Level>(args->logLevel));
    const int status = handleHashCommand(*args);
    phashcache::logger::shutdown();

    return status;
}
