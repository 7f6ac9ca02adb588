#pragma once
#include <string>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <chrono>
#include <nlohmann/json.hpp>
#include <sys/types.h>

namespace fs = std::filesystem;

enum class StoreErrorKind {
    NotFound,
    SymlinkRejected,
    NotRegularFile,
    PathOutsideRoot,
    WriteFailure,
    ReadFailure,
    Corrupt,
    SetupFailure
};

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind(kind) {}
    StoreErrorKind getKind() const { return kind; }

private:
    StoreErrorKind kind;
};

/**
 * @brief Private side-channel directory shared with the callback receiver.
 *
 * Layout:
 *   <root>/callback-<id>.json   artifact written by the receiver
 *   <root>/.tmp-<random>        in-flight atomic write
 *   <root>/receiver.pid         PID marker of the running receiver
 *
 * The root is mode 0700, files are 0600, and no operation ever follows a
 * symbolic link inside the root.
 */
class SecureStore {
public:
    /** Creates (or re-permissions) the root. @throws StoreError(SetupFailure) */
    explicit SecureStore(const std::string& rootPath);

    const fs::path& getRoot() const { return root; }

    /** @throws StoreError(PathOutsideRoot) for ids that are empty or carry path syntax. */
    fs::path pathFor(const std::string& id) const;

    /** Atomic replace, mode 0600. @throws StoreError(WriteFailure / PathOutsideRoot) */
    void writeArtifact(const std::string& id, const nlohmann::json& artifact);

    /**
     * @brief Read and parse an artifact without following links.
     * @throws StoreError NotFound, SymlinkRejected, NotRegularFile, ReadFailure, Corrupt
     *
     * Loose permission bits only produce a warning.
     */
    nlohmann::json readArtifact(const std::string& id) const;

    /** Best-effort; never throws and never unlinks a symlink. */
    void deleteArtifact(const std::string& id) noexcept;

    /** True when a regular (non-symlink) artifact exists for id. */
    bool artifactExists(const std::string& id) const noexcept;

    /** Removes artifacts and abandoned temp files older than maxAge. Returns the count removed. */
    size_t sweepStale(std::chrono::milliseconds maxAge) noexcept;

    fs::path pidMarkerPath() const { return root / "receiver.pid"; }
    std::optional<pid_t> readPidMarker() const noexcept;
    void writePidMarker(pid_t pid);
    void removePidMarker() noexcept;

    static bool isValidId(const std::string& id);

private:
    fs::path root;

    void ensurePrivateDir();
    void atomicWrite(const fs::path& target, const std::string& data);
    void ensureInsideRoot(const fs::path& candidate) const;
};
