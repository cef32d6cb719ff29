#include "TileNameNormalizer.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace LvTiles {

bool TileNameNormalizer::isKnownExtension(const std::string& extension) {
    static const std::array<const char*, 4> known = {"png", "bin", "jpg", "jpeg"};

    std::string lowered = extension;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::find_if(known.begin(), known.end(),
        [&lowered](const char* ext) { return lowered == ext; }) != known.end();
}

std::string TileNameNormalizer::normalize(const std::string& filename) {
    std::string name = filename;

    while (true) {
        size_t dot = name.rfind('.');
        if (dot == std::string::npos) {
            break;
        }
        // Leading dots belong to the stem
        if (name.find_first_not_of('.') >= dot) {
            break;
        }
        if (!isKnownExtension(name.substr(dot + 1))) {
            break;
        }
        name.erase(dot);
    }

    return name;
}

} // namespace LvTiles
