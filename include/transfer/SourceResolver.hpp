#pragma once

#include "transfer/model/Source.hpp"

#include <string>
#include <vector>

namespace sf::transfer {

// Maps a reference to the backend kind that handles it. Ordered rules, first match wins.
class SourceResolver {
public:
    explicit SourceResolver(std::vector<std::string> extraExtractorDomains = {});

    // Throws ResolutionError when nothing matches
    [[nodiscard]] model::Source resolve(const std::string& reference) const;

    static bool isTorrentReference(const std::string& lowered);
    static bool isCloudDriveUrl(const std::string& lowered);
    bool isExtractorUrl(const std::string& lowered) const;

private:
    std::vector<std::string> extractorDomains_;
};

}
