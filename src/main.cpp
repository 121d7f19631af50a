// src/main.cpp
#include <Piston/Cli.hpp>
#include <Piston/Utils/Logger.hpp>

int main(int argc, char* argv[]) {
    int exitCode = Piston::Cli::run(argc, argv);
    Piston::Utils::Logger::Shutdown();
    return exitCode;
}
