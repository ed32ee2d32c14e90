#include "presencelink/core/socket_paths.hpp"

#include <algorithm>
#include <cstdlib>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace presencelink {
namespace core {

namespace {

void appendUnique(std::vector<std::string>& directories, const std::string& directory) {
    if (std::find(directories.begin(), directories.end(), directory) == directories.end()) {
        directories.push_back(directory);
    }
}

std::string joinPath(const std::string& directory, const std::string& name) {
    if (!directory.empty() && directory.back() == '/') {
        return directory + name;
    }
    return directory + "/" + name;
}

uint32_t currentUid() {
#ifdef _WIN32
    return 0;
#else
    return static_cast<uint32_t>(::getuid());
#endif
}

bool isWindows() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

} // namespace

std::optional<std::string> processEnvironment(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::vector<std::string> candidateDirectories(const EnvLookup& env, uint32_t uid) {
    std::vector<std::string> directories;

    if (auto runtime = env("XDG_RUNTIME_DIR")) {
        appendUnique(directories, *runtime);
        appendUnique(directories, joinPath(*runtime, SANDBOX_APP_SUBPATH));
    }
    for (const char* name : {"TMPDIR", "TMP", "TEMP"}) {
        if (auto temp = env(name)) {
            appendUnique(directories, *temp);
        }
    }

    if (directories.empty()) {
        const std::string fallback = "/run/user/" + std::to_string(uid);
        directories.push_back(fallback);
        directories.push_back(joinPath(fallback, SANDBOX_APP_SUBPATH));
    }
    return directories;
}

std::string socketPath(const std::string& directory, uint32_t number) {
    return joinPath(directory, IPC_SOCKET_PREFIX + std::to_string(number));
}

std::string pipePath(uint32_t number) {
    return std::string("\\\\.\\pipe\\") + IPC_SOCKET_PREFIX + std::to_string(number);
}

std::vector<CandidatePath> candidatePaths(const PipeConfig& pipe, const IpcConfig& config,
                                          const EnvLookup& env, uint32_t uid) {
    std::vector<CandidatePath> paths;

    if (pipe.mode() == PipeConfig::Mode::CustomPath) {
        paths.push_back(CandidatePath{0, pipe.path()});
        return paths;
    }

    uint32_t first = 0;
    uint32_t last = config.maxSockets;
    if (pipe.mode() == PipeConfig::Mode::PipeNumber) {
        first = pipe.number();
        last = pipe.number() + 1;
    }

    if (isWindows()) {
        for (uint32_t i = first; i < last; ++i) {
            paths.push_back(CandidatePath{i, pipePath(i)});
        }
        return paths;
    }

    for (const auto& directory : candidateDirectories(env, uid)) {
        for (uint32_t i = first; i < last; ++i) {
            paths.push_back(CandidatePath{i, socketPath(directory, i)});
        }
    }
    return paths;
}

std::vector<CandidatePath> candidatePaths(const PipeConfig& pipe, const IpcConfig& config) {
    return candidatePaths(pipe, config, processEnvironment, currentUid());
}

} // namespace core
} // namespace presencelink
