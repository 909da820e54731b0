// nestgeom/render/comment_renderer.cpp - Human-readable unit descriptions
#include <fmt/core.h>

#include <string>

#include "nestgeom/render/renderer.hpp"

namespace nestgeom
{

std::string CommentRenderer::render(const Unit * unit)
{
  std::string out;
  if (unit->opens_group()) {
    out += "(";
  }
  out += visit(unit);
  if (unit->up != nullptr) {
    out += " in ";
    out += render(unit->up);
  }
  if (unit->closes_group()) {
    out += ")";
  }
  return out;
}

std::string CommentRenderer::visit_surface_ref(const SurfaceRef * unit)
{
  return fmt::format("surf '{}'", unit->name);
}

std::string CommentRenderer::visit_cell_ref(const CellRef * unit)
{
  return fmt::format("cell '{}'", unit->name);
}

std::string CommentRenderer::visit_nested_cell_ref(const NestedCellRef * unit)
{
  if (unit->latticeSpec == nullptr) {
    return fmt::format("cell '{}'", unit->name);
  }
  return fmt::format("cell '{}'-lat {}", unit->name, lattice_comment(*unit->latticeSpec));
}

std::string CommentRenderer::visit_universe_ref(const UniverseRef * unit)
{
  return fmt::format("univ '{}'", unit->name);
}

std::string CommentRenderer::visit_union_unit(const UnionUnit * unit)
{
  return "union of (" + render_members(unit->alternatives) + ")";
}

std::string CommentRenderer::visit_vector_unit(const VectorUnit * unit)
{
  return "over (" + render_members(unit->elements) + ")";
}

std::string CommentRenderer::render_members(gsl::span<Unit * const> members)
{
  std::string out;
  bool first = true;
  for (const Unit * member : members) {
    if (!first) {
      out += ", ";
    }
    first = false;
    out += render(member);
  }
  return out;
}

std::string render_comment(const Unit * unit)
{
  CommentRenderer renderer;
  return renderer.render(unit);
}

}  // namespace nestgeom
