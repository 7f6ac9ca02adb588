#include "bridge/ReceiverSupervisor.h"
#include "utils/Logger.h"
#include <cerrno>
#include <cstring>
#include <csignal>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

ReceiverSupervisor::ReceiverSupervisor(SecureStore& store, EventLoop& loop, const std::vector<std::string>& command,
                                       int maxAttempts, std::chrono::milliseconds attemptInterval)
    : store(store), loop(loop), command(command), maxAttempts(maxAttempts), attemptInterval(attemptInterval) {}

ReceiverSupervisor::~ReceiverSupervisor() {
    if (startTimer != 0) {
        loop.cancel(startTimer);
    }
}

bool ReceiverSupervisor::isProcessAlive(pid_t pid) {
    if (pid <= 0) return false;
    // signal 0 probes without delivering anything
    if (kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

bool ReceiverSupervisor::isReceiverAlive() const {
    auto pid = store.readPidMarker();
    return pid && isProcessAlive(*pid);
}

void ReceiverSupervisor::launchDetached(const std::vector<std::string>& argvStrings) {
    if (argvStrings.empty()) {
        throw BridgeError(ErrorKind::HelperStartFailure, "Receiver command is not configured");
    }
    std::vector<char*> argv;
    argv.reserve(argvStrings.size() + 1);
    for (const auto& arg : argvStrings) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t child = fork();
    if (child < 0) {
        throw BridgeError(ErrorKind::HelperStartFailure,
                          std::string("Failed to fork receiver: ") + std::strerror(errno));
    }

    if (child == 0) {
        setsid();
        pid_t grandchild = fork();
        if (grandchild < 0) _exit(1);
        if (grandchild > 0) _exit(0);

        int devNull = open("/dev/null", O_RDWR);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            dup2(devNull, STDOUT_FILENO);
            dup2(devNull, STDERR_FILENO);
            if (devNull > STDERR_FILENO) close(devNull);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(child, &status, 0) < 0) {
        if (errno != EINTR) {
            throw BridgeError(ErrorKind::HelperStartFailure,
                              std::string("Failed to wait for receiver launcher: ") + std::strerror(errno));
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        throw BridgeError(ErrorKind::HelperStartFailure, "Receiver launcher failed to detach");
    }
}

void ReceiverSupervisor::ensureRunning(ReadyHandler onReady, FailureHandler onFailure) {
    if (startTimer != 0) {
        waiters.push_back({std::move(onReady), std::move(onFailure)});
        return;
    }

    auto pid = store.readPidMarker();
    if (pid && isProcessAlive(*pid)) {
        onReady();
        return;
    }
    if (pid) {
        Logger::getInstance().warn("Receiver PID " + std::to_string(*pid) + " is gone, discarding stale marker");
        store.removePidMarker();
    }

    try {
        launchDetached(command);
        Logger::getInstance().info("Started callback receiver: " + command.front());
    } catch (const BridgeError& e) {
        onFailure(e);
        return;
    }

    waiters.push_back({std::move(onReady), std::move(onFailure)});
    attempts = 0;
    startTimer = loop.setInterval(attemptInterval, [this]() { onStartupTick(); });
}

void ReceiverSupervisor::onStartupTick() {
    ++attempts;
    if (isReceiverAlive()) {
        Logger::getInstance().success("Callback receiver is up after " + std::to_string(attempts) + " checks");
        finishStartup(nullptr);
        return;
    }
    if (attempts >= maxAttempts) {
        BridgeError failure(ErrorKind::HelperStartFailure,
                            "Callback receiver did not start within " +
                                std::to_string(maxAttempts * attemptInterval.count()) +
                                "ms. Check that " + command.front() + " is installed and on PATH.");
        Logger::getInstance().error(failure.what());
        finishStartup(&failure);
    }
}

void ReceiverSupervisor::finishStartup(const BridgeError* failure) {
    loop.cancel(startTimer);
    startTimer = 0;
    attempts = 0;

    auto pending = std::move(waiters);
    waiters.clear();
    for (auto& waiter : pending) {
        if (failure) {
            waiter.onFailure(*failure);
        } else {
            waiter.onReady();
        }
    }
}
