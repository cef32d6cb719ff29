#pragma once

#include "TileTypes.h"
#include "core/CFG.h"
#include "plugins/PixelSource.h"

namespace LvTiles {

/**
 * @brief Full run: discover, plan, convert, report.
 *
 * Throws FatalConfigurationError if the input root is missing; in that case
 * nothing, not even the output root, is created. Per-tile failures are in
 * the returned report and never throw.
 */
BatchReport convertAllTiles(const CFG& cfg, const PixelSource& source);

} // namespace LvTiles
