#include "bridge/ActionRegistry.h"
#include "core/BridgeError.h"
#include <algorithm>

ActionRegistry::ActionRegistry(const std::vector<Action>& list) {
    for (const auto& action : list) {
        actions[action.name] = action;
    }
}

ActionRegistry ActionRegistry::ulysses() {
    // name, whitelisted, destructive, needsResponse
    return ActionRegistry({
        {"new-sheet", true, false, false},
        {"new-group", true, false, false},
        {"insert", true, false, false},
        {"attach-note", true, false, false},
        {"attach-keywords", true, false, false},
        {"attach-image", true, false, false},
        {"open", true, false, false},
        {"open-all", true, false, false},
        {"open-recent", true, false, false},
        {"open-favorites", true, false, false},
        {"copy", true, false, false},
        {"get-version", true, false, true},
        {"authorize", true, false, true},
        {"read-sheet", true, false, true},
        {"get-item", true, false, true},
        {"get-root-items", true, false, true},
        {"move", true, true, false},
        {"trash", true, true, false},
        {"set-group-title", true, true, false},
        {"set-sheet-title", true, true, false},
        {"remove-keywords", true, true, false},
        {"update-note", true, true, false},
        {"remove-note", true, true, false},
    });
}

const Action* ActionRegistry::find(const std::string& name) const {
    auto it = actions.find(name);
    if (it == actions.end()) {
        return nullptr;
    }
    return &it->second;
}

const Action& ActionRegistry::validateAction(const std::string& name) const {
    const Action* action = find(name);
    if (!action || !action->isWhitelisted) {
        throw BridgeError(ErrorKind::InvalidInput, "Invalid action: " + name);
    }
    return *action;
}

bool ActionRegistry::isDestructive(const std::string& name) const {
    const Action* action = find(name);
    return action && action->isDestructive;
}

bool ActionRegistry::needsResponse(const std::string& name) const {
    const Action* action = find(name);
    return action && action->needsResponse;
}

std::vector<std::string> ActionRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(actions.size());
    for (const auto& [name, action] : actions) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}
