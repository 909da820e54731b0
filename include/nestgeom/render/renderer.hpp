// nestgeom/render/renderer.hpp - Comment and wire-format rendering of units
//
// Both renderers walk a chain outward from the node they are given:
//
//   text(n) = [open]  own(n)  [sep text(n->up)]  [close]
//
// `open` is emitted where the node has an outer level but no inner one and
// `close` where it has an inner level but no outer one, so a chain is
// bracketed only at its two ends. Union and vector members are rendered
// with the same rule, each carrying its own chain.
//
#pragma once

#include <string>

#include "nestgeom/render/registry.hpp"
#include "nestgeom/unit/unit.hpp"
#include "nestgeom/unit/visitor.hpp"

namespace nestgeom
{

// ============================================================================
// Lattice specs
// ============================================================================

/// "linear idx 3", "x range 0:1, y range 0:0, z range 0:2", "coords (1, 2, 3)"
[[nodiscard]] std::string lattice_comment(const LatticeSpec & spec);

/// "3", "0:1 0:0 0:2", " 1 2 3, 4 5 6" (without the enclosing brackets)
[[nodiscard]] std::string lattice_wire(const LatticeSpec & spec);

// ============================================================================
// Comment rendering
// ============================================================================

/**
 * Renders the human-readable description used in input-file comments.
 *
 * Example: "(cell 'fuel' in univ 'pin' in cell 'assembly')"
 * Never consults a registry and never throws.
 */
class CommentRenderer : public ConstUnitVisitor<CommentRenderer, std::string>
{
public:
  /// Render `unit` and every level outward from it.
  [[nodiscard]] std::string render(const Unit * unit);

  std::string visit_surface_ref(const SurfaceRef * unit);
  std::string visit_cell_ref(const CellRef * unit);
  std::string visit_nested_cell_ref(const NestedCellRef * unit);
  std::string visit_universe_ref(const UniverseRef * unit);
  std::string visit_union_unit(const UnionUnit * unit);
  std::string visit_vector_unit(const VectorUnit * unit);

private:
  [[nodiscard]] std::string render_members(gsl::span<Unit * const> members);
};

// ============================================================================
// Wire-format rendering
// ============================================================================

/**
 * Renders the unit in the simulation input syntax.
 *
 * Example: " ( 1 < U=2 < 3)"
 * Names are resolved through the registry; a missing name propagates
 * NameNotFoundError and no output is produced.
 */
class WireRenderer : public ConstUnitVisitor<WireRenderer, std::string>
{
public:
  explicit WireRenderer(const Registry & registry) : registry_(registry) {}

  /// Render `unit` and every level outward from it.
  [[nodiscard]] std::string render(const Unit * unit);

  std::string visit_surface_ref(const SurfaceRef * unit);
  std::string visit_cell_ref(const CellRef * unit);
  std::string visit_nested_cell_ref(const NestedCellRef * unit);
  std::string visit_universe_ref(const UniverseRef * unit);
  std::string visit_union_unit(const UnionUnit * unit);
  std::string visit_vector_unit(const VectorUnit * unit);

private:
  const Registry & registry_;
};

/// Convenience wrapper around CommentRenderer.
[[nodiscard]] std::string render_comment(const Unit * unit);

/// Convenience wrapper around WireRenderer.
[[nodiscard]] std::string render_wire(const Unit * unit, const Registry & registry);

}  // namespace nestgeom
