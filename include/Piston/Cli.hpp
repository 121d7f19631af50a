// include/Piston/Cli.hpp
#ifndef PISTON_CLI_HPP
#define PISTON_CLI_HPP

#include <Piston/Config.hpp>
#include <Piston/MetaClient.hpp>
#include <filesystem>
#include <functional>
#include <string>

namespace Piston::Cli {

    inline constexpr int kExitOk = 0;
    inline constexpr int kExitFailure = 1;
    inline constexpr int kExitUsage = 2;

    // Entry point of the piston executable. Returns the process exit code.
    int run(int argc, char* argv[]);

    // Runs a command and turns any escaping std::exception into kExitFailure, logged as critical
    int runGuarded(const std::function<int()>& command);

    // <mappingsDir>/<versionId>-client.tsrg or -server.tsrg
    std::filesystem::path defaultMappingsPath(const Config& config, const std::string& versionId, MappingSide side);

} // namespace Piston::Cli

#endif // PISTON_CLI_HPP
