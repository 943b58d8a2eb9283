// Print what a basename resolves to: the files found, the backend chosen,
// shape and element type, consistency problems and sidecar metadata.
//
// Usage:
//   fv_info <basename> [--ignore-cache] [--keys] [--check]

#include "fv/core/types/Exceptions.hpp"
#include "fv/core/types/Store.hpp"
#include "fv/core/util/Logging.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <string>

namespace po = boost::program_options;

int main(int argc, char* argv[])
{
    po::options_description opts("fv_info options");
    opts.add_options()
        ("help,h", "Show help")
        ("basename", po::value<std::string>()->required(), "Dataset basename or file")
        ("ignore-cache", po::bool_switch()->default_value(false), "Describe the source, not the container")
        ("keys", po::bool_switch()->default_value(false), "Print the sidecar metadata")
        ("check", po::bool_switch()->default_value(false), "Check container and metadata consistency")
        ("log-level", po::value<std::string>()->default_value("warn"), "trace, debug, info, warn, error");

    po::positional_options_description pos;
    pos.add("basename", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(opts).positional(pos).run(), vm);
        if (vm.count("help")) {
            std::cout << opts << "\n";
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\nUse --help for usage\n";
        return 1;
    }

    SetLogLevel(vm["log-level"].as<std::string>());

    try {
        fv::StoreOptions storeOpts;
        storeOpts.ignoreCachedContainer = vm["ignore-cache"].as<bool>();
        fv::Store store(vm["basename"].as<std::string>(), storeOpts);

        const auto& files = store.files();
        std::cout << store.describe() << "\n";
        if (files.containerExists()) {
            std::cout << "  container: " << files.container.string() << "\n";
        }
        for (const auto& src : files.candidates) {
            std::cout << "  file:      " << src.string() << "\n";
        }
        std::cout << "  sidecar:   " << files.sidecar.string() << "\n";

        if (vm["check"].as<bool>()) {
            auto problems = store.check();
            if (problems.empty()) {
                std::cout << "No problems found\n";
            }
            for (const auto& p : problems) {
                std::cout << "  problem:   " << p << "\n";
            }
        }

        if (vm["keys"].as<bool>()) {
            std::cout << store.readExtra().dump(4) << "\n";
        }
    } catch (const fv::Error& e) {
        Logger()->error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger()->error("Unexpected error: {}", e.what());
        return 1;
    }
    return 0;
}
