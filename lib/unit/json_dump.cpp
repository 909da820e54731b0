// nestgeom/unit/json_dump.cpp - JSON serialization of units
//
#include "nestgeom/unit/json_dump.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "nestgeom/basic/casting.hpp"
#include "nestgeom/unit/unit_enums.hpp"

namespace nestgeom
{
namespace
{

using nlohmann::json;

json j_bounds(IndexBounds b) { return json::array({b.first, b.last}); }

json j_members(gsl::span<Unit * const> members)
{
  json arr = json::array();
  for (const Unit * m : members) {
    arr.push_back(to_json(m));
  }
  return arr;
}

json j_payload(const Unit * u)
{
  json j{{"type", std::string(to_string(u->get_kind()))}};

  if (isa<SurfaceRef>(u) || isa<CellRef>(u) || isa<UniverseRef>(u)) {
    j["name"] = std::string(unit_name(u));
  } else if (const auto * nc = dyn_cast<NestedCellRef>(u)) {
    j["name"] = std::string(nc->name);
    j["lattice"] = to_json(nc->latticeSpec);
  } else if (const auto * un = dyn_cast<UnionUnit>(u)) {
    j["alternatives"] = j_members(un->alternatives);
  } else if (const auto * vec = dyn_cast<VectorUnit>(u)) {
    j["elements"] = j_members(vec->elements);
  }

  return j;
}

}  // namespace

json to_json(const LatticeSpec * spec)
{
  if (!spec) return nullptr;

  json j{{"type", std::string(to_string(spec->get_kind()))}};

  if (const auto * lin = dyn_cast<LinearIndexSpec>(spec)) {
    j["index"] = lin->index;
  } else if (const auto * rng = dyn_cast<IndexRangeSpec>(spec)) {
    j["x"] = j_bounds(rng->x);
    j["y"] = j_bounds(rng->y);
    j["z"] = j_bounds(rng->z);
  } else if (const auto * cor = dyn_cast<CoordinateListSpec>(spec)) {
    json points = json::array();
    for (const LatticeIndex3 & p : cor->points) {
      points.push_back(json::array({p.i, p.j, p.k}));
    }
    j["points"] = std::move(points);
  }

  return j;
}

json to_json(const Unit * unit)
{
  if (!unit) return nullptr;

  json j = j_payload(unit);
  j["hasInner"] = unit->down != nullptr;
  j["up"] = to_json(unit->up);
  return j;
}

}  // namespace nestgeom
