// nestgeom/unit/unit.cpp - Chain navigation helpers
#include "nestgeom/unit/unit.hpp"

namespace nestgeom
{

std::string_view unit_name(const Unit * unit) noexcept
{
  if (const auto * s = dyn_cast<SurfaceRef>(unit)) return s->name;
  if (const auto * c = dyn_cast<CellRef>(unit)) return c->name;
  if (const auto * nc = dyn_cast<NestedCellRef>(unit)) return nc->name;
  if (const auto * u = dyn_cast<UniverseRef>(unit)) return u->name;
  return {};
}

Unit * innermost(Unit * unit) noexcept
{
  while (unit != nullptr && unit->down != nullptr) {
    unit = unit->down;
  }
  return unit;
}

const Unit * innermost(const Unit * unit) noexcept
{
  return innermost(const_cast<Unit *>(unit));
}

Unit * outermost(Unit * unit) noexcept
{
  while (unit != nullptr && unit->up != nullptr) {
    unit = unit->up;
  }
  return unit;
}

const Unit * outermost(const Unit * unit) noexcept
{
  return outermost(const_cast<Unit *>(unit));
}

uint64_t bin_count(const Unit * unit) noexcept
{
  uint64_t total = 1;
  for (const Unit * level = unit; level != nullptr; level = level->up) {
    if (const auto * vec = dyn_cast<VectorUnit>(level)) {
      uint64_t level_bins = 0;
      for (const Unit * elem : vec->elements) {
        level_bins += bin_count(elem);
      }
      total *= level_bins;
    }
  }
  return total;
}

}  // namespace nestgeom
