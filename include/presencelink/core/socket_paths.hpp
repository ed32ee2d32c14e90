#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "presencelink/core/pipe_config.hpp"

namespace presencelink {
namespace core {

/// Sandboxed application subdirectory searched under runtime directories.
constexpr const char* SANDBOX_APP_SUBPATH = "app/com.discordapp.Discord";

/**
 * @brief Environment accessor, injectable for tests.
 */
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

/**
 * @brief Reads the process environment. Empty values count as unset.
 */
std::optional<std::string> processEnvironment(const char* name);

/**
 * @brief One address to probe, tagged with its pipe number.
 */
struct CandidatePath {
    uint32_t pipeNumber = 0;
    std::string path;

    bool operator==(const CandidatePath& other) const {
        return pipeNumber == other.pipeNumber && path == other.path;
    }
};

/**
 * @brief Ordered Unix base directories.
 *
 * $XDG_RUNTIME_DIR, its sandbox subpath, $TMPDIR, $TMP, $TEMP. When none of
 * these is set, /run/user/<uid> and its sandbox subpath. Duplicates are
 * dropped keeping the first occurrence.
 */
std::vector<std::string> candidateDirectories(const EnvLookup& env, uint32_t uid);

/// "{dir}/discord-ipc-{number}"
std::string socketPath(const std::string& directory, uint32_t number);

/// "\\.\pipe\discord-ipc-{number}"
std::string pipePath(uint32_t number);

/**
 * @brief Every address the transport would try for the selector, in order.
 *
 * On Windows the directories are ignored and named pipes are listed instead.
 */
std::vector<CandidatePath> candidatePaths(const PipeConfig& pipe, const IpcConfig& config,
                                          const EnvLookup& env, uint32_t uid);

/**
 * @brief Same as above using the process environment and the current user id.
 */
std::vector<CandidatePath> candidatePaths(const PipeConfig& pipe, const IpcConfig& config);

} // namespace core
} // namespace presencelink
