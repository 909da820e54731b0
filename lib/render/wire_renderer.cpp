// nestgeom/render/wire_renderer.cpp - Simulation input syntax for units
//
// Every token carries its own leading space, so concatenating the members
// of a union or vector yields a space-separated list.
//
#include <fmt/core.h>

#include <string>

#include "nestgeom/render/renderer.hpp"

namespace nestgeom
{

std::string WireRenderer::render(const Unit * unit)
{
  std::string out;
  if (unit->opens_group()) {
    out += " (";
  }
  out += visit(unit);
  if (unit->up != nullptr) {
    out += " <";
    out += render(unit->up);
  }
  if (unit->closes_group()) {
    out += ")";
  }
  return out;
}

std::string WireRenderer::visit_surface_ref(const SurfaceRef * unit)
{
  return fmt::format(" {}", registry_.surface_number(unit->name));
}

std::string WireRenderer::visit_cell_ref(const CellRef * unit)
{
  return fmt::format(" {}", registry_.cell_number(unit->name));
}

std::string WireRenderer::visit_nested_cell_ref(const NestedCellRef * unit)
{
  const int64_t number = registry_.cell_number(unit->name);
  if (unit->latticeSpec == nullptr) {
    return fmt::format(" {}", number);
  }
  return fmt::format(" {}[{}]", number, lattice_wire(*unit->latticeSpec));
}

std::string WireRenderer::visit_universe_ref(const UniverseRef * unit)
{
  return fmt::format(" U={}", registry_.universe_number(unit->name));
}

std::string WireRenderer::visit_union_unit(const UnionUnit * unit)
{
  std::string out = " (";
  for (const Unit * alt : unit->alternatives) {
    out += render(alt);
  }
  out += ")";
  return out;
}

// Multiple-bin format: elements sit side by side at the same level.
std::string WireRenderer::visit_vector_unit(const VectorUnit * unit)
{
  std::string out;
  for (const Unit * elem : unit->elements) {
    out += render(elem);
  }
  return out;
}

std::string render_wire(const Unit * unit, const Registry & registry)
{
  WireRenderer renderer(registry);
  return renderer.render(unit);
}

}  // namespace nestgeom
