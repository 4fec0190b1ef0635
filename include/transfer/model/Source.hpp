#pragma once

#include <string>

namespace sf::transfer::model {

enum class SourceKind { Torrent, DirectHttp, Extractor, CloudClone };

struct Source {
    SourceKind kind{SourceKind::DirectHttp};
    std::string reference;
};

std::string to_string(SourceKind k);

}
