#pragma once
#include <string>
#include <vector>
#include <utility>
#include <optional>

// Ordered so the URL reflects the order the tool supplied them in.
using ParamList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief OS "open by URL" primitive.
 *
 * open() throws BridgeError(InvocationFailure) when the URL could not be handed over.
 */
class IUrlOpener {
public:
    virtual ~IUrlOpener() = default;
    virtual void open(const std::string& url) = 0;
};

/** Runs `<command> <url>` through fork/execvp; no shell is ever involved. */
class ProcessUrlOpener : public IUrlOpener {
public:
    explicit ProcessUrlOpener(const std::string& command);
    void open(const std::string& url) override;

private:
    std::string command;
};

class CommandDispatcher {
public:
    CommandDispatcher(const std::string& appScheme, const std::string& callbackScheme, IUrlOpener& opener);

    /**
     * @brief Compose the x-callback-url for an action.
     *
     * With a correlation id, x-success / x-error addresses on the callback
     * scheme are appended after the caller's parameters.
     */
    std::string build(const std::string& action, const ParamList& params,
                      const std::optional<std::string>& correlationId = std::nullopt) const;

    /** @throws BridgeError(InvocationFailure) */
    void dispatch(const std::string& url);

    std::string successAddress(const std::string& correlationId) const;
    std::string errorAddress(const std::string& correlationId) const;

    /** Everything except RFC 3986 unreserved characters becomes %XX. */
    static std::string percentEncode(const std::string& value);
    static std::string percentDecode(const std::string& value);

private:
    std::string appScheme;
    std::string callbackScheme;
    IUrlOpener& opener;
};
