/*
 * FPPCommandClient.cpp - Command dispatch and content listing
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace FPP {

using json = nlohmann::json;

FPPCommandClient::FPPCommandClient(std::string commandUrl, std::string sequenceListUrl, std::string playlistListUrl)
    : m_command_url(std::move(commandUrl)),
      m_sequence_list_url(std::move(sequenceListUrl)),
      m_playlist_list_url(std::move(playlistListUrl))
{
}

std::string FPPCommandClient::buildCommand(const std::string& command, const std::vector<std::string>& args)
{
    json body;
    body["command"] = command;
    if (!args.empty()) {
        body["args"] = args;
    }
    return body.dump();
}

std::vector<std::string> FPPCommandClient::parseNameList(const std::string& body, const std::string& suffix)
{
    std::vector<std::string> names;
    json root = json::parse(body, nullptr, false);
    if (root.is_discarded() || !root.is_array()) {
        return names;
    }
    for (const auto& entry : root) {
        if (entry.is_string()) {
            names.push_back(entry.get<std::string>() + suffix);
        }
    }
    return names;
}

CommandResult FPPCommandClient::startPlaylist(const std::string& name)
{
    if (name.empty()) {
        return CommandResult{false, "Nothing selected"};
    }
    Debug::log("fpp", "FPPCommandClient: Start Playlist ", name);
    return send(buildCommand("Start Playlist", {name}));
}

CommandResult FPPCommandClient::stopNow()
{
    Debug::log("fpp", "FPPCommandClient: Stop Now");
    return send(buildCommand("Stop Now"));
}

std::vector<std::string> FPPCommandClient::listSequences()
{
    return fetchList(m_sequence_list_url, ".fseq");
}

std::vector<std::string> FPPCommandClient::listPlaylists()
{
    return fetchList(m_playlist_list_url, "");
}

CommandResult FPPCommandClient::send(const std::string& body)
{
    auto response = IO::HTTP::HTTPClient::post(m_command_url, body, "application/json", COMMAND_TIMEOUT_MS);
    if (!response.success) {
        Debug::log("fpp", "FPPCommandClient: command failed: ", response.statusMessage);
        return CommandResult{false, "FPP command failed"};
    }
    return CommandResult{true, ""};
}

std::vector<std::string> FPPCommandClient::fetchList(const std::string& url, const std::string& suffix)
{
    auto response = IO::HTTP::HTTPClient::get(url, LIST_TIMEOUT_MS);
    if (!response.success) {
        Debug::log("fpp", "FPPCommandClient: list request to ", url, " failed: ", response.statusMessage);
        return {};
    }
    return parseNameList(response.body, suffix);
}

} // namespace FPP
} // namespace Eavesdrop
