/*
 * FPPCommandClient.h - Command dispatch and content listing
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FPPCOMMANDCLIENT_H
#define FPPCOMMANDCLIENT_H

namespace Eavesdrop {
namespace FPP {

// No direct includes - all includes should be in eavesdrop.h

struct CommandResult {
    bool success = false;
    std::string error;
};

/**
 * @brief Starts and stops shows and lists what can be started.
 *
 * "Start Playlist" accepts both playlist names and sequence file names, so
 * listed sequences carry their ".fseq" extension.
 */
class FPPCommandClient {
public:
    static constexpr long COMMAND_TIMEOUT_MS = 3000;
    static constexpr long LIST_TIMEOUT_MS = 2000;

    FPPCommandClient(std::string commandUrl, std::string sequenceListUrl, std::string playlistListUrl);

    CommandResult startPlaylist(const std::string& name);
    CommandResult stopNow();

    /**
     * @brief Sequence names with ".fseq" appended; empty on failure.
     */
    std::vector<std::string> listSequences();

    std::vector<std::string> listPlaylists();

    /**
     * @brief JSON body for a command with optional arguments.
     */
    static std::string buildCommand(const std::string& command, const std::vector<std::string>& args = {});

    /**
     * @brief Decode a JSON array of names, appending suffix to each.
     *
     * Non-string members are skipped; anything but an array yields nothing.
     */
    static std::vector<std::string> parseNameList(const std::string& body, const std::string& suffix = "");

private:
    CommandResult send(const std::string& body);
    std::vector<std::string> fetchList(const std::string& url, const std::string& suffix);

    std::string m_command_url;
    std::string m_sequence_list_url;
    std::string m_playlist_list_url;
};

} // namespace FPP
} // namespace Eavesdrop

#endif // FPPCOMMANDCLIENT_H
