// src/Cli.cpp
#include <Piston/Cli.hpp>
#include <Piston/FetchError.hpp>
#include <Piston/HttpManager.hpp>
#include <Piston/Mappings/MappingConverter.hpp>
#include <Piston/Utils/Logger.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

namespace Piston::Cli {

namespace {

struct Options {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::filesystem::path> dataDir;
    std::optional<std::string> manifestUrl;
    std::optional<std::string> output;
    std::optional<std::string> typeFilter;
    bool server = false;
    bool verbose = false;
    bool help = false;
};

void printUsage(std::ostream& out) {
    out << "Usage: piston <command> [options]\n"
           "\n"
           "Commands:\n"
           "  convert <input> [output]            Convert a ProGuard mapping file to TSRG (stdout by default)\n"
           "  versions [--type <kind>]            List published versions (release, snapshot, old_beta, old_alpha)\n"
           "  mappings <version> [--server] [-o <file>]\n"
           "                                      Fetch and convert a version's mappings ('latest', 'snapshot' or an id)\n"
           "  download <version> <type> [-o <file>]\n"
           "                                      Download client, server, client_mappings or server_mappings\n"
           "\n"
           "Options:\n"
           "  --data-dir <path>     Data directory (default ./.piston_data)\n"
           "  --manifest-url <url>  Version manifest URL\n"
           "  -v, --verbose         Log debug output to the console\n"
           "  -h, --help            Show this help\n";
}

// Returns std::nullopt on a malformed command line, after printing why
std::optional<Options> parseArguments(int argc, char* argv[]) {
    Options options;
    auto takeValue = [&](int& i, const std::string& flag) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--server") {
            options.server = true;
        } else if (arg == "--data-dir") {
            auto value = takeValue(i, arg);
            if (!value) return std::nullopt;
            options.dataDir = *value;
        } else if (arg == "--manifest-url") {
            options.manifestUrl = takeValue(i, arg);
            if (!options.manifestUrl) return std::nullopt;
        } else if (arg == "-o" || arg == "--output") {
            options.output = takeValue(i, arg);
            if (!options.output) return std::nullopt;
        } else if (arg == "--type") {
            options.typeFilter = takeValue(i, arg);
            if (!options.typeFilter) return std::nullopt;
        } else if (arg.size() > 1 && arg.front() == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

bool readFile(const std::filesystem::path& path, std::string& contents) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    contents = buffer.str();
    return true;
}

bool writeOutput(const std::optional<std::filesystem::path>& path, const std::string& contents) {
    if (!path) {
        std::cout << contents;
        std::cout.flush();
        return static_cast<bool>(std::cout);
    }
    std::ofstream out(*path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << contents;
    return static_cast<bool>(out);
}

int runConvert(const Options& options) {
    if (options.positional.empty() || options.positional.size() > 2) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    std::filesystem::path input = options.positional[0];
    std::optional<std::filesystem::path> output;
    if (options.positional.size() == 2) {
        output = options.positional[1];
    } else if (options.output) {
        output = *options.output;
    }

    std::string mappings;
    if (!readFile(input, mappings)) {
        CORE_LOG_ERROR("Could not read mapping file: {}", input.string());
        return kExitFailure;
    }
    CORE_LOG_INFO("Converting {} ({} bytes)", input.string(), mappings.size());

    Mappings::ConversionStats stats;
    std::string converted = Mappings::convertMappings(mappings, stats);
    if (!writeOutput(output, converted)) {
        CORE_LOG_ERROR("Could not write converted mappings to {}", output ? output->string() : "stdout");
        return kExitFailure;
    }
    CORE_LOG_INFO("Wrote {} classes, {} methods, {} fields ({} lines skipped, {} duplicate classes).",
        stats.classes, stats.methods, stats.fields, stats.skipped, stats.duplicateClasses);
    return kExitOk;
}

int runVersions(const Options& options, MetaClient& client) {
    std::optional<ReleaseKind> filter;
    if (options.typeFilter) {
        try {
            filter = string_to_release_kind(*options.typeFilter);
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << "\n";
            return kExitUsage;
        }
    }

    RootManifest manifest = client.fetchRootManifest();
    CORE_LOG_INFO("Latest release: {}, latest snapshot: {}", manifest.latest.release, manifest.latest.snapshot);
    for (const auto& version : manifest.versions) {
        if (filter && version.type != *filter) {
            continue;
        }
        std::cout << version.id << '\t' << release_kind_to_string(version.type) << '\t' << version.releaseTime << '\n';
    }
    return kExitOk;
}

int runMappings(const Options& options, const Config& config, MetaClient& client) {
    if (options.positional.size() != 1) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    const std::string& versionId = options.positional[0];
    MappingSide side = options.server ? MappingSide::SERVER : MappingSide::CLIENT;

    ConvertedMappings converted = client.fetchMappings(versionId, side);

    std::filesystem::path output = options.output
        ? std::filesystem::path(*options.output)
        : defaultMappingsPath(config, converted.versionId, side);
    if (!writeOutput(output, converted.text)) {
        CORE_LOG_ERROR("Could not write converted mappings to {}", output.string());
        return kExitFailure;
    }
    CORE_LOG_INFO("Mappings for {} written to {} ({} classes).", converted.versionId, output.string(), converted.stats.classes);
    return kExitOk;
}

int runDownload(const Options& options, const Config& config, HttpManager& http, MetaClient& client) {
    if (options.positional.size() != 2) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    const std::string& versionId = options.positional[0];
    DownloadType type;
    try {
        type = string_to_download_type(options.positional[1]);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return kExitUsage;
    }

    RootManifest manifest = client.fetchRootManifest();
    auto release = MetaClient::resolveRelease(manifest, versionId);
    if (!release) {
        CORE_LOG_ERROR("Version {} not found in manifest.", versionId);
        return kExitFailure;
    }
    VersionManifest version = client.fetchVersionManifest(*release);
    auto download = version.download(type);
    if (!download) {
        CORE_LOG_ERROR("Version {} has no {} download.", version.id, download_type_to_string(type));
        return kExitFailure;
    }

    std::string extension = (type == DownloadType::CLIENT || type == DownloadType::SERVER) ? ".jar" : ".txt";
    std::filesystem::path output = options.output
        ? std::filesystem::path(*options.output)
        : config.baseDataPath / (version.id + "-" + download_type_to_string(type) + extension);

    cpr::Response response = http.Download(output, cpr::Url{download->url});
    if (!HttpManager::IsSuccess(response)) {
        return kExitFailure;
    }
    CORE_LOG_INFO("Saved {} ({} bytes).", output.string(), download->size);
    return kExitOk;
}

} // namespace

std::filesystem::path defaultMappingsPath(const Config& config, const std::string& versionId, MappingSide side) {
    return config.mappingsDir / (versionId + (side == MappingSide::SERVER ? "-server" : "-client") + ".tsrg");
}

int runGuarded(const std::function<int()>& command) {
    try {
        return command();
    } catch (const FetchError& e) {
        CORE_LOG_CRITICAL("{}", e.what());
    } catch (const std::exception& e) {
        CORE_LOG_CRITICAL("Unexpected failure: {}", e.what());
    }
    return kExitFailure;
}

int run(int argc, char* argv[]) {
    std::optional<Options> options = parseArguments(argc, argv);
    if (!options) {
        printUsage(std::cerr);
        return kExitUsage;
    }
    if (options->help || options->command.empty()) {
        printUsage(options->help ? std::cout : std::cerr);
        return options->help ? kExitOk : kExitUsage;
    }

    return runGuarded([&]() -> int {
        Config config = options->dataDir ? Config(*options->dataDir) : Config();
        if (options->manifestUrl) {
            config.manifestUrl = *options->manifestUrl;
        }
        Utils::Logger::Init(config.logsDir, "piston.log",
                            options->verbose ? spdlog::level::debug : spdlog::level::info,
                            spdlog::level::trace);
        CORE_LOG_DEBUG("Piston starting. Data directory: {}", config.baseDataPath.string());

        if (options->command == "convert") {
            return runConvert(*options);
        }

        HttpManager http(config);
        MetaClient client(http, config.manifestUrl);
        if (options->command == "versions") {
            return runVersions(*options, client);
        }
        if (options->command == "mappings") {
            return runMappings(*options, config, client);
        }
        if (options->command == "download") {
            return runDownload(*options, config, http, client);
        }
        std::cerr << "Unknown command: " << options->command << "\n";
        printUsage(std::cerr);
        return kExitUsage;
    });
}

} // namespace Piston::Cli
