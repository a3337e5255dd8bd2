#pragma once

#include <map>
#include <string>

struct ProcessResult {
    int exitStatus{-1};
    std::string output;  // stdout and stderr interleaved
};

// Variables added to the child's environment only; they never appear on a command line
using ProcessEnvironment = std::map<std::string, std::string>;

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs command through /bin/sh. Returns false if the process could not be started.
    virtual bool run(const std::string& command, const ProcessEnvironment& environment,
                     ProcessResult& result) = 0;
};

class PopenProcessRunner : public ProcessRunner {
public:
    bool run(const std::string& command, const ProcessEnvironment& environment,
             ProcessResult& result) override;
};
