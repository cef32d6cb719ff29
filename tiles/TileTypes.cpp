#include "TileTypes.h"

#include <algorithm>

namespace LvTiles {

const char* ConversionStatusName(ConversionStatus status) {
    switch (status) {
        case ConversionStatus::Success: return "converted";
        case ConversionStatus::DecodeFailed: return "decode_failed";
        case ConversionStatus::EncodeFailed: return "encode_failed";
    }
    return "unknown";
}

size_t BatchReport::converted() const {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
        [](const ConversionOutcome& o) { return o.succeeded(); }));
}

size_t BatchReport::failed() const {
    return outcomes.size() - converted();
}

} // namespace LvTiles
