/*
 * CompanionLocator.cpp - Find the audio sequence that accompanies a show item
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Fseq {

CompanionLocator::CompanionLocator(std::string directory)
    : CompanionLocator(std::move(directory), &CompanionLocator::fileExists)
{
}

CompanionLocator::CompanionLocator(std::string directory, ExistsPredicate exists)
    : m_directory(std::move(directory)), m_exists(std::move(exists))
{
    if (!m_directory.empty() && m_directory.back() != '/') {
        m_directory += '/';
    }
}

std::string CompanionLocator::baseName(const std::string& itemId)
{
    std::string name = itemId;
    size_t slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }
    size_t dot = name.find_last_of('.');
    if (dot != std::string::npos) {
        name = name.substr(0, dot);
    }
    return name;
}

const std::vector<CompanionLocator::Derivation>& CompanionLocator::defaultDerivations()
{
    static const std::vector<Derivation> derivations = {
        [](const std::string& base) { return base + "_Audio.fseq"; },
        [](const std::string& base) { return base + "_audio.fseq"; },
        [](const std::string& base) { return base + ".fseq"; },
    };
    return derivations;
}

bool CompanionLocator::fileExists(const std::string& path)
{
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::vector<std::string> CompanionLocator::candidates(const std::string& itemId) const
{
    std::vector<std::string> paths;
    const std::string base = baseName(itemId);
    if (base.empty()) {
        return paths;
    }
    for (const auto& derive : defaultDerivations()) {
        paths.push_back(m_directory + derive(base));
    }
    return paths;
}

std::optional<std::string> CompanionLocator::locate(const std::string& itemId) const
{
    for (const auto& path : candidates(itemId)) {
        if (m_exists(path)) {
            Debug::log("fseq", "CompanionLocator: ", itemId, " -> ", path);
            return path;
        }
    }
    Debug::log("fseq", "CompanionLocator: no companion data for ", itemId, " in ", m_directory);
    return std::nullopt;
}

} // namespace Fseq
} // namespace Eavesdrop
