// Convert a video, a (possibly split) TIFF stack or a container into a
// container file, optionally keeping only a range of frames.
//
// Usage:
//   fv_convert --input <file-or-basename> [--output <file.dat>]
//              [--first N] [--last N] [--mode memory|mapped]
//              [--config options.json]
//              [--export [--profile P] [--fps F] [--suffix S] [--export-file B]]

#include "fv/core/io/Converter.hpp"
#include "fv/core/io/Export.hpp"
#include "fv/core/types/Exceptions.hpp"
#include "fv/core/types/Store.hpp"
#include "fv/core/types/StoreOptions.hpp"
#include "fv/core/util/Logging.hpp"

#include <boost/program_options.hpp>

#include <filesystem>
#include <exception>
#include <iostream>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace fs = std::filesystem;

static std::optional<fv::BackendMode> parseMode(const std::string& s)
{
    if (s.empty()) return std::nullopt;
    if (s == "memory") return fv::BackendMode::InMemory;
    if (s == "mapped") return fv::BackendMode::MappedContainer;
    throw fv::InputError("--mode must be 'memory' or 'mapped', got '" + s + "'");
}

int main(int argc, char* argv[])
{
    po::options_description opts("fv_convert options");
    opts.add_options()
        ("help,h", "Show help")
        ("input,i", po::value<std::string>()->required(), "Source file or basename")
        ("output,o", po::value<std::string>()->default_value(""), "Output container (default: <basename>.dat)")
        ("first", po::value<std::size_t>(), "First frame to keep")
        ("last", po::value<std::size_t>(), "Last frame to keep (inclusive)")
        ("chunk-mib", po::value<double>(), "Memory budget per chunk in MiB")
        ("mode", po::value<std::string>()->default_value(""), "Header mode: memory or mapped")
        ("force-new", po::bool_switch()->default_value(false), "Rewrite an up-to-date container")
        ("config", po::value<std::string>(), "JSON store options (transform, chunk budget)")
        ("export", po::bool_switch()->default_value(false), "Also export the converted frames")
        ("profile", po::value<std::string>()->default_value("MPEG-4"),
         "Export profile: MPEG-4, Archival, Motion JPEG AVI, Motion JPEG 2000, TIF, TIF NOCOMP")
        ("fps", po::value<double>()->default_value(10.0), "Frame rate of exported videos")
        ("suffix", po::value<std::string>()->default_value("_exportAs"), "Appended to the export name")
        ("export-file", po::value<std::string>(), "Export basename (default: the container's)")
        ("no-overwrite", po::bool_switch()->default_value(false), "Keep an existing export file")
        ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warn, error")
        ("log-file", po::value<std::string>(), "Also log to this file");

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(opts).run(), vm);
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
    if (vm.count("log-file")) {
        AddLogFile(vm["log-file"].as<std::string>());
    }

    try {
        fv::StoreOptions storeOpts;
        if (vm.count("config")) {
            storeOpts = fv::loadStoreOptions(vm["config"].as<std::string>());
        }

        fv::io::ExportOptions exportOpts;
        exportOpts.profile = fv::io::exportProfileFromString(vm["profile"].as<std::string>());
        exportOpts.frameRate = vm["fps"].as<double>();
        exportOpts.suffix = vm["suffix"].as<std::string>();
        exportOpts.overwrite = !vm["no-overwrite"].as<bool>();
        if (vm.count("export-file")) {
            exportOpts.filename = vm["export-file"].as<std::string>();
        }

        fv::io::ConvertOptions convert;
        convert.destination = vm["output"].as<std::string>();
        convert.transform = storeOpts.transform;
        convert.chunkBudgetMiB = vm.count("chunk-mib") ? vm["chunk-mib"].as<double>()
                                                       : storeOpts.chunkBudgetMiB;
        convert.mode = parseMode(vm["mode"].as<std::string>());
        convert.forceNew = vm["force-new"].as<bool>();

        if (vm.count("first") || vm.count("last")) {
            if (!vm.count("last")) {
                std::cerr << "Error: --first needs --last\n";
                return 1;
            }
            const std::size_t first = vm.count("first") ? vm["first"].as<std::size_t>() : 0;
            const std::size_t last = vm["last"].as<std::size_t>();
            if (last < first) {
                std::cerr << "Error: --last must not be below --first\n";
                return 1;
            }
            std::vector<std::size_t> frames(last - first + 1);
            std::iota(frames.begin(), frames.end(), first);
            convert.frames = std::move(frames);
        }

        const fs::path written = fv::io::convertToContainer(vm["input"].as<std::string>(), convert);
        if (written.empty()) {
            std::cerr << "Error: nothing was converted\n";
            return 1;
        }
        std::cout << "Wrote " << written.string() << "\n";

        if (vm["export"].as<bool>()) {
            fv::Store store(written);
            const fs::path exported = store.exportAs(exportOpts);
            if (!exported.empty()) {
                std::cout << "Exported " << exported.string() << "\n";
            }
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
