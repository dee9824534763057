/*
 * CompanionLocator.h - Find the audio sequence that accompanies a show item
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef COMPANIONLOCATOR_H
#define COMPANIONLOCATOR_H

namespace Eavesdrop {
namespace Fseq {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief Maps a playing item ("Elvis.fseq") to its audio data file.
 *
 * Candidate names are derived from the item's base name in priority order:
 * "{base}_Audio.fseq", "{base}_audio.fseq", "{base}.fseq". The first
 * candidate that exists in the audio directory wins.
 */
class CompanionLocator {
public:
    using Derivation = std::function<std::string(const std::string& base)>;
    using ExistsPredicate = std::function<bool(const std::string& path)>;

    explicit CompanionLocator(std::string directory);
    CompanionLocator(std::string directory, ExistsPredicate exists);

    /**
     * @brief Item id with any directory and its last extension removed.
     */
    static std::string baseName(const std::string& itemId);

    static const std::vector<Derivation>& defaultDerivations();

    /**
     * @brief True for an existing regular file.
     */
    static bool fileExists(const std::string& path);

    /**
     * @brief Full candidate paths in the order they are tried.
     */
    std::vector<std::string> candidates(const std::string& itemId) const;

    /**
     * @brief First existing candidate, or std::nullopt if the item has no
     * companion data.
     */
    std::optional<std::string> locate(const std::string& itemId) const;

    const std::string& directory() const { return m_directory; }

private:
    std::string m_directory;
    ExistsPredicate m_exists;
};

} // namespace Fseq
} // namespace Eavesdrop

#endif // COMPANIONLOCATOR_H
