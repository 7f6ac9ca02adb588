#include "UlyssesTools.h"
#include "ToolRegistry.h"
#include "bridge/ActionRegistry.h"
#include "bridge/CommandExecutor.h"
#include "bridge/ParamValidator.h"
#include <memory>
#include <optional>
#include <stdexcept>

namespace {
const std::vector<std::string> kFormats = {"markdown", "text", "html"};
const std::vector<std::string> kYesNo = {"YES", "NO"};

constexpr size_t kMaxSheetText = 1000000;
constexpr size_t kMaxNoteText = 100000;
constexpr size_t kMaxKeywords = 1000;

ToolField requiredField(const std::string& name, const std::string& description, size_t maxLength = 0,
                        const std::vector<std::string>& allowed = {}) {
    return {name, description, true, maxLength, allowed, ""};
}

ToolField optionalField(const std::string& name, const std::string& description,
                        const std::vector<std::string>& allowed = {}) {
    return {name, description, false, 0, allowed, ""};
}

ToolField accessToken() {
    return {"access_token", "Required. Access token obtained from ulysses_authorize", true, 0, {}, "access-token"};
}

ToolField formatField(const std::string& what) {
    return optionalField("format", "Optional. Format of the " + what + ". Defaults to markdown.", kFormats);
}

nlohmann::json textResult(const std::string& text) {
    return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}};
}
} // namespace

namespace UlyssesTools {

const char* const kAuthorizeSecurityNote =
    "SECURITY NOTE: Ulysses will ask you to authorize this app. Once authorized, you'll receive an access "
    "token that provides access to your Ulysses library. Keep this token secure and do not share it. The "
    "token will remain valid until you revoke it in Ulysses preferences.";

std::vector<ToolDefinition> definitions() {
    return {
        {"ulysses_new_sheet", "new-sheet",
         "Create a new sheet in Ulysses with the specified text content. Optionally specify a group, format "
         "(markdown/text/html), position, and whether it should be a material sheet.",
         {requiredField("text", "The content to insert into the new sheet", kMaxSheetText),
          optionalField("group", "Optional. Group name, path (e.g., /My Group/Subgroup), or identifier where the "
                            "sheet should be created. Defaults to Inbox."),
          formatField("imported text"),
          optionalField("index", "Optional. Position of the new sheet in its parent group (0 for first position)"),
          optionalField("material", "Optional. Whether the sheet should be created as a material sheet. Defaults to NO.",
                        kYesNo)}},

        {"ulysses_new_group", "new-group", "Create a new group in Ulysses",
         {requiredField("name", "The name of the group to be created", 255),
          optionalField("parent", "Optional. Parent group name, path, or identifier. Defaults to top level."),
          optionalField("index", "Optional. Position of the new group in its parent (0 for first position)")}},

        {"ulysses_insert", "insert", "Insert or append text to an existing sheet in Ulysses",
         {requiredField("id", "The identifier of the sheet to insert text into"),
          requiredField("text", "The text content to insert", kMaxSheetText),
          formatField("imported text"),
          optionalField("position", "Optional. Position to insert text (begin or end). Defaults to appending.",
                        {"begin", "end"}),
          optionalField("newline", "Optional. How to handle newlines around inserted text",
                        {"prepend", "append", "enclose"})}},

        {"ulysses_attach_note", "attach-note", "Attach a note to a sheet in Ulysses",
         {requiredField("id", "The identifier of the sheet to attach the note to"),
          requiredField("text", "The note content", kMaxNoteText),
          formatField("note text")}},

        {"ulysses_attach_keywords", "attach-keywords", "Add one or more keywords to a sheet in Ulysses",
         {requiredField("id", "The identifier of the sheet to attach keywords to"),
          requiredField("keywords", "Comma-separated list of keywords (e.g., 'Draft,Important')", kMaxKeywords)}},

        {"ulysses_attach_image", "attach-image",
         "Attach an image to a sheet in Ulysses using base64-encoded image data",
         {requiredField("id", "The identifier of the sheet to attach the image to"),
          requiredField("image", "Base64-encoded image data"),
          requiredField("format", "Image format extension (png, jpg, gif, pdf, etc.)")}},

        {"ulysses_open", "open", "Open a specific sheet or group in Ulysses",
         {requiredField("id", "Group name, path (e.g., /My Group/Subgroup), or sheet/group identifier to open")}},

        {"ulysses_open_all", "open-all", "Open the 'All' section in Ulysses showing all sheets", {}},
        {"ulysses_open_recent", "open-recent", "Open the 'Last 7 Days' section in Ulysses", {}},
        {"ulysses_open_favorites", "open-favorites", "Open the 'Favorites' section in Ulysses", {}},

        {"ulysses_get_version", "get-version", "Get the Ulysses version and API version information", {}},

        {"ulysses_authorize", "authorize",
         "Request authorization to access the Ulysses library. Required for reading content and destructive "
         "operations. Returns an access token to be used with other commands.",
         {requiredField("appname", "Name of the application requesting access (e.g., 'Cline MCP', 'LM Studio')", 100)}},

        {"ulysses_read_sheet", "read-sheet",
         "Read the contents of a sheet (requires authorization). Returns title, text content, keywords, and notes.",
         {requiredField("id", "The identifier of the sheet to read"),
          accessToken(),
          optionalField("text", "Optional. Whether to include the full text content. Defaults to NO.", kYesNo)}},

        {"ulysses_get_item", "get-item", "Get information about a sheet or group (requires authorization)",
         {requiredField("id", "The identifier of the item (sheet or group) to get information about"),
          accessToken(),
          optionalField("recursive", "Optional. For groups, whether to include all sub-groups recursively. Defaults to YES.",
                        kYesNo)}},

        {"ulysses_get_root_items", "get-root-items",
         "Get the root sections of the Ulysses library (iCloud, On My Mac, external folders). Can be used to get "
         "a full library listing. Requires authorization.",
         {accessToken(),
          optionalField("recursive", "Optional. Whether to get a deep listing of the entire library. Defaults to YES.",
                        kYesNo)}},

        {"ulysses_move", "move", "Move a sheet or group to a different location (requires authorization)",
         {requiredField("id", "The identifier of the item to move"),
          accessToken(),
          optionalField("targetGroup", "Optional. Target group name, path, or identifier"),
          optionalField("index", "Optional. Position in the target group (0 for first position)")}},

        {"ulysses_copy", "copy", "Copy a sheet or group to a different location",
         {requiredField("id", "The identifier of the item to copy"),
          optionalField("targetGroup", "Optional. Target group name, path, or identifier"),
          optionalField("index", "Optional. Position in the target group (0 for first position)")}},

        {"ulysses_trash", "trash", "Move a sheet or group to the trash (requires authorization)",
         {requiredField("id", "The identifier of the item to trash"), accessToken()}},

        {"ulysses_set_group_title", "set-group-title", "Change the title of a group (requires authorization)",
         {requiredField("group", "Group name, path, or identifier"),
          requiredField("title", "New title for the group", 255),
          accessToken()}},

        {"ulysses_set_sheet_title", "set-sheet-title",
         "Change the first paragraph of a sheet (requires authorization)",
         {requiredField("sheet", "The identifier of the sheet"),
          requiredField("title", "New title text", 1000),
          requiredField("type", "Type of paragraph to use for the title", 0,
                   {"heading1", "heading2", "heading3", "heading4", "heading5", "heading6", "comment", "filename"}),
          accessToken()}},

        {"ulysses_remove_keywords", "remove-keywords", "Remove keywords from a sheet (requires authorization)",
         {requiredField("id", "The identifier of the sheet"),
          requiredField("keywords", "Comma-separated list of keywords to remove", kMaxKeywords),
          accessToken()}},

        {"ulysses_update_note", "update-note",
         "Change an existing note attachment on a sheet (requires authorization)",
         {requiredField("id", "The identifier of the sheet"),
          requiredField("index", "Position of the note to change (0 for first note, 1 for second, etc.)"),
          requiredField("text", "New content for the note", kMaxNoteText),
          accessToken(),
          formatField("note text")}},

        {"ulysses_remove_note", "remove-note", "Remove a note attachment from a sheet (requires authorization)",
         {requiredField("id", "The identifier of the sheet"),
          requiredField("index", "Position of the note to remove (0 for first note, 1 for second, etc.)"),
          accessToken()}},
    };
}

void registerAll(ToolRegistry& tools, CommandExecutor& executor, const ActionRegistry& actions) {
    for (auto& definition : definitions()) {
        const Action* action = actions.find(definition.action);
        if (!action) {
            throw std::logic_error("Tool " + definition.name + " refers to unknown action " + definition.action);
        }
        bool returnsData = action->needsResponse;
        tools.registerTool(std::make_unique<UlyssesActionTool>(std::move(definition), executor, returnsData));
    }
}

} // namespace UlyssesTools

UlyssesActionTool::UlyssesActionTool(ToolDefinition definition, CommandExecutor& executor, bool returnsData)
    : definition(std::move(definition)), executor(executor), returnsData(returnsData) {}

nlohmann::json UlyssesActionTool::getSchema() const {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json requiredNames = nlohmann::json::array();

    for (const auto& field : definition.fields) {
        nlohmann::json property = {{"type", "string"}, {"description", field.description}};
        if (!field.allowed.empty()) {
            property["enum"] = field.allowed;
        }
        if (field.maxLength > 0) {
            property["maxLength"] = field.maxLength;
        }
        properties[field.name] = property;
        if (field.required) {
            requiredNames.push_back(field.name);
        }
    }

    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!requiredNames.empty()) {
        schema["required"] = requiredNames;
    }
    return schema;
}

nlohmann::json UlyssesActionTool::execute(const nlohmann::json& args) {
    const nlohmann::json input = args.is_object() ? args : nlohmann::json::object();

    ParamList params;
    for (const auto& field : definition.fields) {
        const std::string& key = field.urlKey.empty() ? field.name : field.urlKey;
        std::optional<std::string> value;

        if (field.required) {
            value = ParamValidator::validateRequired(input.contains(field.name) ? input.at(field.name)
                                                                                : nlohmann::json(),
                                                     field.name);
        } else {
            value = ParamValidator::optionalString(input, field.name);
            if (!value) continue;
        }

        if (field.maxLength > 0) {
            ParamValidator::validateLength(*value, field.maxLength, field.name);
        }
        if (!field.allowed.empty()) {
            ParamValidator::validateEnum(value, field.allowed, field.name);
        }
        params.emplace_back(key, *value);
    }

    nlohmann::json result = executor.executeBlocking(definition.action, params);

    std::string text;
    if (returnsData) {
        text = result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        text = result.value("message", "Successfully executed " + definition.action);
    }
    if (definition.action == "authorize") {
        text += "\n\n";
        text += UlyssesTools::kAuthorizeSecurityNote;
    }
    return textResult(text);
}
