#include "store/SecureStore.h"
#include "utils/Logger.h"
#include <cctype>
#include <limits>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <random>
#include <sstream>
#include <iomanip>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {
constexpr const char* kArtifactPrefix = "callback-";
constexpr const char* kArtifactSuffix = ".json";
constexpr const char* kTempPrefix = ".tmp-";
constexpr size_t kMaxIdLength = 200;
constexpr off_t kMaxArtifactBytes = 64 * 1024 * 1024;

std::string errnoText(int err) {
    return std::string(std::strerror(err));
}

std::string randomToken() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << rng();
    return oss.str();
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Closes the descriptor on every exit path.
class FdGuard {
public:
    explicit FdGuard(int fd) : fd(fd) {}
    ~FdGuard() {
        if (fd >= 0) ::close(fd);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    int get() const { return fd; }
    int release() {
        int out = fd;
        fd = -1;
        return out;
    }

private:
    int fd;
};
} // namespace

SecureStore::SecureStore(const std::string& rootPath) {
    if (rootPath.empty()) {
        throw StoreError(StoreErrorKind::SetupFailure, "Secure store path is empty");
    }
    root = fs::absolute(fs::u8path(rootPath)).lexically_normal();
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    ensurePrivateDir();
}

void SecureStore::ensurePrivateDir() {
    const std::string path = root.string();
    struct stat st{};
    if (::lstat(path.c_str(), &st) == 0) {
        if (S_ISLNK(st.st_mode)) {
            throw StoreError(StoreErrorKind::SetupFailure, "Secure store directory is a symlink: " + path);
        }
        if (!S_ISDIR(st.st_mode)) {
            throw StoreError(StoreErrorKind::SetupFailure, "Secure store path is not a directory: " + path);
        }
        if (st.st_uid != ::getuid()) {
            throw StoreError(StoreErrorKind::SetupFailure, "Secure store directory is owned by another user: " + path);
        }
        if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0 && ::chmod(path.c_str(), S_IRWXU) != 0) {
            throw StoreError(StoreErrorKind::SetupFailure,
                             "Failed to restrict secure store permissions: " + errnoText(errno));
        }
        return;
    }

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) {
        throw StoreError(StoreErrorKind::SetupFailure,
                         "Failed to create secure store directory: " + ec.message());
    }
    if (::chmod(path.c_str(), S_IRWXU) != 0) {
        throw StoreError(StoreErrorKind::SetupFailure,
                         "Failed to restrict secure store permissions: " + errnoText(errno));
    }
}

bool SecureStore::isValidId(const std::string& id) {
    if (id.empty() || id.size() > kMaxIdLength) return false;
    if (id.front() == '.') return false;
    for (unsigned char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_' || c == '.';
        if (!ok) return false;
    }
    return id.find("..") == std::string::npos;
}

void SecureStore::ensureInsideRoot(const fs::path& candidate) const {
    fs::path normal = candidate.lexically_normal();
    if (normal.parent_path() != root) {
        throw StoreError(StoreErrorKind::PathOutsideRoot,
                         "Invalid file path: must be within secure store directory");
    }
}

fs::path SecureStore::pathFor(const std::string& id) const {
    if (!isValidId(id)) {
        throw StoreError(StoreErrorKind::PathOutsideRoot, "Invalid correlation id");
    }
    fs::path candidate = root / (kArtifactPrefix + id + kArtifactSuffix);
    ensureInsideRoot(candidate);
    return candidate;
}

void SecureStore::atomicWrite(const fs::path& target, const std::string& data) {
    ensureInsideRoot(target);
    fs::path tmp = root / (kTempPrefix + randomToken());
    const std::string tmpStr = tmp.string();

    FdGuard fd(::open(tmpStr.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, S_IRUSR | S_IWUSR));
    if (fd.get() < 0) {
        throw StoreError(StoreErrorKind::WriteFailure, "Failed to create secure file: " + errnoText(errno));
    }

    auto fail = [&](const std::string& what) {
        int err = errno;
        ::close(fd.release());
        ::unlink(tmpStr.c_str());
        throw StoreError(StoreErrorKind::WriteFailure, what + ": " + errnoText(err));
    };

    if (::fchmod(fd.get(), S_IRUSR | S_IWUSR) != 0) {
        fail("Failed to set secure file permissions");
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd.get(), data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("Failed to write secure file");
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd.get()) != 0) {
        fail("Failed to flush secure file");
    }
    if (::close(fd.release()) != 0) {
        int err = errno;
        ::unlink(tmpStr.c_str());
        throw StoreError(StoreErrorKind::WriteFailure, "Failed to close secure file: " + errnoText(err));
    }

    // rename replaces a symlink at target rather than writing through it
    if (::rename(tmpStr.c_str(), target.string().c_str()) != 0) {
        int err = errno;
        ::unlink(tmpStr.c_str());
        throw StoreError(StoreErrorKind::WriteFailure, "Failed to publish secure file: " + errnoText(err));
    }
}

void SecureStore::writeArtifact(const std::string& id, const nlohmann::json& artifact) {
    atomicWrite(pathFor(id), artifact.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

nlohmann::json SecureStore::readArtifact(const std::string& id) const {
    const fs::path path = pathFor(id);
    const std::string pathStr = path.string();

    struct stat st{};
    if (::lstat(pathStr.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            throw StoreError(StoreErrorKind::NotFound, "Artifact does not exist");
        }
        throw StoreError(StoreErrorKind::ReadFailure, "Failed to stat artifact: " + errnoText(errno));
    }
    if (S_ISLNK(st.st_mode)) {
        throw StoreError(StoreErrorKind::SymlinkRejected, "Artifact is a symlink - refusing to read");
    }
    if (!S_ISREG(st.st_mode)) {
        throw StoreError(StoreErrorKind::NotRegularFile, "Artifact is not a regular file");
    }
    if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
        std::ostringstream mode;
        mode << std::oct << (st.st_mode & 0777);
        Logger::getInstance().warn("Artifact " + path.filename().string() + " has unexpected permissions: " +
                                   mode.str());
    }

    FdGuard fd(::open(pathStr.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (fd.get() < 0) {
        int err = errno;
        if (err == ELOOP) {
            throw StoreError(StoreErrorKind::SymlinkRejected, "Artifact is a symlink - refusing to read");
        }
        if (err == ENOENT) {
            throw StoreError(StoreErrorKind::NotFound, "Artifact does not exist");
        }
        throw StoreError(StoreErrorKind::ReadFailure, "Failed to open artifact: " + errnoText(err));
    }

    struct stat fst{};
    if (::fstat(fd.get(), &fst) != 0 || !S_ISREG(fst.st_mode)) {
        throw StoreError(StoreErrorKind::NotRegularFile, "Artifact is not a regular file");
    }
    if (fst.st_size > kMaxArtifactBytes) {
        throw StoreError(StoreErrorKind::Corrupt, "Artifact exceeds size limit");
    }

    std::string content;
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StoreError(StoreErrorKind::ReadFailure, "Failed to read artifact: " + errnoText(errno));
        }
        if (n == 0) break;
        content.append(buffer, static_cast<size_t>(n));
    }

    try {
        auto parsed = nlohmann::json::parse(content);
        if (!parsed.is_object()) {
            throw StoreError(StoreErrorKind::Corrupt, "Artifact is not a JSON object");
        }
        return parsed;
    } catch (const nlohmann::json::parse_error& e) {
        throw StoreError(StoreErrorKind::Corrupt, std::string("Artifact is not valid JSON: ") + e.what());
    }
}

void SecureStore::deleteArtifact(const std::string& id) noexcept {
    try {
        const std::string pathStr = pathFor(id).string();
        struct stat st{};
        if (::lstat(pathStr.c_str(), &st) != 0) {
            return; // already gone
        }
        if (S_ISLNK(st.st_mode)) {
            Logger::getInstance().warn("Refusing to delete symlink at artifact path for " + id);
            return;
        }
        if (::unlink(pathStr.c_str()) != 0 && errno != ENOENT) {
            Logger::getInstance().error("Failed to delete artifact for " + id + ": " + errnoText(errno));
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Failed to delete artifact: ") + e.what());
    }
}

bool SecureStore::artifactExists(const std::string& id) const noexcept {
    try {
        struct stat st{};
        if (::lstat(pathFor(id).string().c_str(), &st) != 0) return false;
        return S_ISREG(st.st_mode);
    } catch (const std::exception&) {
        return false;
    }
}

size_t SecureStore::sweepStale(std::chrono::milliseconds maxAge) noexcept {
    size_t removed = 0;
    try {
        std::error_code ec;
        fs::directory_iterator it(root, ec);
        if (ec) {
            Logger::getInstance().error("Cleanup error: " + ec.message());
            return 0;
        }
        const auto nowSec = static_cast<long long>(std::time(nullptr));
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const std::string name = it->path().filename().string();
            bool candidate = (startsWith(name, kArtifactPrefix) && name.size() > std::strlen(kArtifactSuffix) &&
                              name.compare(name.size() - std::strlen(kArtifactSuffix), std::string::npos,
                                           kArtifactSuffix) == 0) ||
                             startsWith(name, kTempPrefix);
            if (!candidate) continue;

            const std::string pathStr = it->path().string();
            struct stat st{};
            if (::lstat(pathStr.c_str(), &st) != 0) continue;
            if (S_ISLNK(st.st_mode) || !S_ISREG(st.st_mode)) continue;

            long long ageMs = (nowSec - static_cast<long long>(st.st_mtime)) * 1000;
            if (ageMs > maxAge.count()) {
                if (::unlink(pathStr.c_str()) == 0) {
                    ++removed;
                    Logger::getInstance().debug("Cleaned up old callback file: " + name);
                }
            }
        }
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Cleanup error: ") + e.what());
    }
    return removed;
}

std::optional<pid_t> SecureStore::readPidMarker() const noexcept {
    const std::string pathStr = pidMarkerPath().string();
    struct stat st{};
    if (::lstat(pathStr.c_str(), &st) != 0) return std::nullopt;
    if (S_ISLNK(st.st_mode) || !S_ISREG(st.st_mode)) {
        Logger::getInstance().warn("Ignoring PID marker that is not a regular file");
        return std::nullopt;
    }

    FdGuard fd(::open(pathStr.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (fd.get() < 0) return std::nullopt;
    char buffer[32] = {0};
    ssize_t n = ::read(fd.get(), buffer, sizeof(buffer) - 1);
    if (n <= 0) return std::nullopt;

    std::string text(buffer, static_cast<size_t>(n));
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.pop_back();
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 10) {
        return std::nullopt;
    }
    long long value = std::stoll(text);
    if (value <= 0 || value > std::numeric_limits<pid_t>::max()) return std::nullopt;
    return static_cast<pid_t>(value);
}

void SecureStore::writePidMarker(pid_t pid) {
    atomicWrite(pidMarkerPath(), std::to_string(pid));
}

void SecureStore::removePidMarker() noexcept {
    const std::string pathStr = pidMarkerPath().string();
    struct stat st{};
    if (::lstat(pathStr.c_str(), &st) != 0) return;
    if (S_ISLNK(st.st_mode)) {
        Logger::getInstance().warn("Refusing to delete symlinked PID marker");
        return;
    }
    ::unlink(pathStr.c_str());
}
