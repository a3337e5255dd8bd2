#pragma once

#include "common/tool_config.hpp"
#include "core/execution_result.hpp"
#include "core/operation.hpp"
#include <ostream>
#include <string>
#include <vector>

struct CommandLine {
    std::string configPath;
    bool verbose{false};
    bool json{false};
    bool showHelp{false};
    bool showVersion{false};
    bool tokenOnly{false};  // "token": print the confirmation token and exit
    std::string hostname;
    Operation operation;
};

class OobCLI {
public:
    explicit OobCLI(EnvLookup env);

    // Returns the process exit status
    int run(int argc, char* argv[]);
    void printUsage(std::ostream& out) const;

    // args excludes the program name
    static bool parseArguments(const std::vector<std::string>& args, CommandLine& commandLine,
                               std::string& error);

    // Text mode: lines and warnings on out, failures as "oobctl: <message>" on err.
    // JSON mode: the result object on out.
    static void render(const ExecutionResult& result, bool json, std::ostream& out, std::ostream& err);

private:
    int execute(const CommandLine& commandLine);

    EnvLookup env_;
};

extern const char* const kOobctlVersion;
