#include "transport/process_runner.hpp"
#include "common/logger.hpp"
#include <cstdio>
#include <cstring>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <sys/wait.h>

namespace {

// popen inherits the caller's environment, so the variables are set for the
// duration of the fork and then restored
class ScopedEnvironment {
public:
    explicit ScopedEnvironment(const ProcessEnvironment& environment) {
        for (const auto& entry : environment) {
            const char* previous = std::getenv(entry.first.c_str());
            saved_.push_back({entry.first, previous != nullptr, previous ? previous : ""});
            setenv(entry.first.c_str(), entry.second.c_str(), 1);
        }
    }
    ~ScopedEnvironment() {
        for (const auto& entry : saved_) {
            if (entry.wasSet) {
                setenv(entry.name.c_str(), entry.value.c_str(), 1);
            } else {
                unsetenv(entry.name.c_str());
            }
        }
    }
    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

private:
    struct Saved {
        std::string name;
        bool wasSet;
        std::string value;
    };
    std::vector<Saved> saved_;
};

std::mutex environmentMutex;

} // namespace

bool PopenProcessRunner::run(const std::string& command, const ProcessEnvironment& environment,
                             ProcessResult& result) {
    result.output.clear();
    result.exitStatus = -1;

    std::string redirected = command + " 2>&1";
    FILE* pipe = nullptr;
    int startErrno = 0;
    {
        std::lock_guard<std::mutex> lock(environmentMutex);
        ScopedEnvironment scoped(environment);
        pipe = popen(redirected.c_str(), "r");
        startErrno = errno;
    }
    if (!pipe) {
        Logger::error("Failed to start process: " + std::string(strerror(startErrno)));
        return false;
    }

    char buffer[4096];
    size_t count;
    while ((count = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        result.output.append(buffer, count);
    }

    int status = pclose(pipe);
    if (status == -1) {
        Logger::error("Failed to reap process: " + std::string(strerror(errno)));
        return false;
    }

    if (WIFEXITED(status)) {
        result.exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitStatus = 128 + WTERMSIG(status);
    }
    return true;
}
