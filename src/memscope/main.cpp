#include <algorithm>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include "events.h"
#include "exceptions.h"
#include "logging.h"
#include "report.h"
#include "session.h"

namespace po = boost::program_options;

using namespace memscope;

namespace {  // unnamed

constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

int
logThresholdFor(int verbosity, bool quiet)
{
    if (quiet) {
        return ERROR;
    }
    switch (verbosity) {
        case 0:
            return WARNING;
        case 1:
            return INFO;
        default:
            return DEBUG;
    }
}

void
printUsage(std::ostream& out, const po::options_description& desc)
{
    out << "Usage: memscope [options] -p PID\n"
        << "       memscope [options] -- COMMAND [ARGS...]\n"
        << "\n"
        << "Samples the memory usage of a running process, or of a command it\n"
        << "starts, and writes a profile when the process ends, the maximum\n"
        << "duration is reached or profiling is interrupted.\n\n"
        << desc << std::endl;
}

}  // unnamed namespace

int
main(int argc, char** argv)
{
    // Everything after "--" belongs to the profiled command.
    std::vector<std::string> command;
    int own_argc = argc;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--") == 0) {
            command.assign(argv + i + 1, argv + argc);
            own_argc = i;
            break;
        }
    }

    double interval_secs = 1.0;
    double duration_secs = 60.0;
    api::SessionOptions options;

    po::options_description desc("Options", 120, 60);
    // clang-format off
    desc.add_options()
        ("pid,p", po::value<pid_t>(),
            "Process ID to profile.")
        ("command", po::value<std::vector<std::string>>(),
            "Command to run and profile.")
        ("output,o", po::value<std::string>(&options.output_file)->default_value("memory_profile.json"),
            "Output file for the JSON profile.")
        ("interval,i", po::value<double>(&interval_secs)->default_value(1.0),
            "Sampling interval in seconds.")
        ("duration,d", po::value<double>(&duration_secs)->default_value(60.0),
            "Maximum profiling duration in seconds.")
        ("live,l", po::bool_switch(&options.live),
            "Print live statistics after every sample.")
        ("compress", po::bool_switch(&options.compress),
            "Compress the JSON profile with LZ4.")
        ("markdown", po::value<std::string>(),
            "Also write a Markdown report to this file.")
        ("top", po::value<size_t>(&options.top_allocations)->default_value(10),
            "Number of active allocations listed in the summary.")
        ("verbose,v", "Log more (repeat for debug output).")
        ("quiet,q", po::bool_switch(),
            "Only log errors.")
        ("help,h", "Show this help message.");
    // clang-format on
    po::options_description visible("Options", 120, 60);
    for (const auto& option : desc.options()) {
        if (option->long_name() != "command") {
            visible.add(option);
        }
    }

    po::positional_options_description positional;
    positional.add("command", -1);

    po::variables_map vm;
    int verbosity = 0;
    try {
        po::parsed_options parsed =
                po::command_line_parser(own_argc, argv).options(desc).positional(positional).run();
        // -v may be repeated, which a plain switch rejects.
        verbosity = static_cast<int>(std::count_if(
                parsed.options.begin(),
                parsed.options.end(),
                [](const po::option& option) { return option.string_key == "verbose"; }));
        parsed.options.erase(
                std::remove_if(
                        parsed.options.begin(),
                        parsed.options.end(),
                        [](const po::option& option) { return option.string_key == "verbose"; }),
                parsed.options.end());
        po::store(parsed, vm);
        if (vm.count("help")) {
            printUsage(std::cout, visible);
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& error) {
        std::cerr << "ERROR: " << error.what() << "\n\n";
        printUsage(std::cerr, visible);
        return EXIT_USAGE;
    }

    setLogThreshold(logThresholdFor(verbosity, vm["quiet"].as<bool>()));

    if (vm.count("pid")) {
        options.pid = vm["pid"].as<pid_t>();
    }
    if (vm.count("command")) {
        auto leading = vm["command"].as<std::vector<std::string>>();
        command.insert(command.begin(), leading.begin(), leading.end());
    }
    options.command = std::move(command);
    if (vm.count("markdown")) {
        options.markdown_file = vm["markdown"].as<std::string>();
    }
    try {
        options.interval = api::durationFromSeconds(interval_secs);
        options.max_duration = api::durationFromSeconds(duration_secs);
        options.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n\n";
        printUsage(std::cerr, visible);
        return EXIT_USAGE;
    }

    events::CancellationSource cancellation;
    events::InterruptWatcher interrupts(cancellation);
    interrupts.start();

    api::SamplingOptions sampling = options.samplingOptions();
    if (options.live) {
        sampling.live_callback = [](const tracking_api::MemorySnapshot& snapshot) {
            report::printLiveStats(snapshot, std::cout);
        };
    }

    tracking_api::ProfileSession session;
    try {
        api::SessionOrchestrator orchestrator(cancellation);
        session = orchestrator.run(options, std::move(sampling));
    } catch (const exception::MemscopeException& e) {
        LOG(ERROR) << e.what();
        return EXIT_FATAL;
    }
    interrupts.stop();

    report::printSummary(session, std::cout, options.top_allocations);

    try {
        api::writeOutputs(session, options);
    } catch (const exception::OutputWriteFailure& e) {
        LOG(ERROR) << e.what();
        return EXIT_FATAL;
    }
    std::cout << "Memory profile saved to: " << options.output_file << std::endl;
    if (options.markdown_file) {
        std::cout << "Markdown report saved to: " << *options.markdown_file << std::endl;
    }
    return 0;
}
