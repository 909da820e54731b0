// nestgeom/unit/json_dump.hpp - JSON description of unit chains
#pragma once

#include <nlohmann/json.hpp>

#include "nestgeom/unit/unit.hpp"

namespace nestgeom
{

/**
 * Serialize a unit and every level outward from it.
 *
 * Each node becomes {"type", ...payload, "hasInner", "up"}; "up" holds the
 * next outer level or null. Inner levels are not followed, so the output is
 * finite for any chain.
 */
[[nodiscard]] nlohmann::json to_json(const Unit * unit);

/// Serialize a lattice spec ({"type": "IndexRange", "x": [0, 1], ...}).
[[nodiscard]] nlohmann::json to_json(const LatticeSpec * spec);

}  // namespace nestgeom
