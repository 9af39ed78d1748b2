#pragma once

#include "core/messaging_gateway.hpp"
#include <nlohmann/json.hpp>
#include <vector>

/**
 * @brief One Bot API update translated into a controller event
 */
struct ParsedUpdate
{
    enum class Type
    {
        Upload,
        Decision,
        Command,
        Ignored
    };

    Type type = Type::Ignored;
    std::uint64_t update_id = 0;
    UploadEvent upload;
    DecisionEvent decision;
    CommandEvent command;
};

/**
 * @brief Translates Bot API JSON updates into events
 */
class UpdateParser
{
public:
    static ParsedUpdate parse(const nlohmann::json &update);

    /**
     * @brief Parse the "result" array of a getUpdates response
     * @throws std::runtime_error if the response is not ok
     */
    static std::vector<ParsedUpdate> parseResponse(const nlohmann::json &response);

private:
    static bool parseMessage(const nlohmann::json &message, ParsedUpdate &out);
    static bool parseCallback(const nlohmann::json &callback, ParsedUpdate &out);
    static void fillFile(const nlohmann::json &file, UploadEvent &upload);
};
