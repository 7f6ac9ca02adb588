#pragma once
#include <string>
#include <vector>
#include <unordered_map>

struct Action {
    std::string name;
    bool isWhitelisted = false;
    bool isDestructive = false;
    bool needsResponse = false;
};

/**
 * @brief Static classification of the x-callback-url actions the bridge may invoke.
 *
 * Built once at startup and never mutated afterwards.
 */
class ActionRegistry {
public:
    ActionRegistry() = default;
    explicit ActionRegistry(const std::vector<Action>& actions);

    /** The Ulysses action table. */
    static ActionRegistry ulysses();

    /**
     * @brief Look up a whitelisted action.
     * @throws BridgeError(InvalidInput) for unknown or non-whitelisted names.
     */
    const Action& validateAction(const std::string& name) const;

    const Action* find(const std::string& name) const;
    bool isDestructive(const std::string& name) const;
    bool needsResponse(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const { return actions.size(); }

private:
    std::unordered_map<std::string, Action> actions;
};
