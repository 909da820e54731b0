// nestgeom/unit/unit_builder.hpp - Construction of tally unit graphs
//
// Factories for every unit and lattice spec kind, plus the operations that
// nest units (join) and merge siblings (union_with, vector_with).
//
// Example: the MCNP unit `(1 2) < U=3 < 4[0:1 0:0 0:2]`
// @code
//   UnitContext ctx;
//   UnitBuilder b(ctx);
//   Unit* chain = b.join(b.union_with(b.surf("A"), b.surf("B")), b.univ("u"));
//   chain = b.join(chain, b.ucell("lat", b.lattice_range({0, 1}, {}, {0, 2})));
// @endcode
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <initializer_list>
#include <string_view>

#include "nestgeom/unit/unit.hpp"
#include "nestgeom/unit/unit_context.hpp"

namespace nestgeom
{

/**
 * Builds units inside a UnitContext.
 *
 * The builder holds no state of its own; any number of builders may share a
 * context. Errors are reported by throwing the NestError subclasses from
 * nestgeom/basic/error.hpp; a throwing call leaves existing nodes unchanged.
 */
class UnitBuilder
{
public:
  explicit UnitBuilder(UnitContext & ctx) : ctx_(ctx) {}

  // ===========================================================================
  // Leaf references
  // ===========================================================================

  SurfaceRef * surf(std::string_view name);
  CellRef * cell(std::string_view name);
  NestedCellRef * ucell(std::string_view name, const LatticeSpec * lattice = nullptr);
  UniverseRef * univ(std::string_view name);

  // ===========================================================================
  // Lattice specs
  // ===========================================================================

  LinearIndexSpec * lattice_index(int64_t index);

  /// Unspecified axes default to {0, 0}.
  IndexRangeSpec * lattice_range(IndexBounds x, IndexBounds y = {}, IndexBounds z = {});

  /// A single element; stored as a one-point list.
  CoordinateListSpec * lattice_coords(LatticeIndex3 point);

  /// @throws EmptyLatticeSelectionError if `points` is empty
  CoordinateListSpec * lattice_coords(gsl::span<const LatticeIndex3> points);
  CoordinateListSpec * lattice_coords(std::initializer_list<LatticeIndex3> points);

  /**
   * Attach a lattice spec to an existing unit.
   *
   * @throws InvalidLatticeAttachmentError unless `unit` is a NestedCellRef
   *         without a lattice spec
   */
  NestedCellRef * attach_lattice(Unit * unit, const LatticeSpec * lattice);

  // ===========================================================================
  // Nesting
  // ===========================================================================

  /**
   * Nest `inner` inside `outer` ("inner of outer").
   *
   * `inner` may be a chain handle returned by an earlier join; the chain's
   * outermost node is linked below `outer`. `outer` may itself be a chain
   * handle. Both links are set together.
   *
   * @return The innermost node of the resulting chain
   * @throws AlreadyNestedError if `outer` already has a nested level, if
   *         both units already belong to the same chain, or if `outer`
   *         already contains `inner`'s chain through union/vector members
   */
  Unit * join(Unit * inner, Unit * outer);

  /// Fold `join` over `levels`, innermost first.
  Unit * chain(std::initializer_list<Unit *> levels);
  Unit * chain(gsl::span<Unit * const> levels);

  // ===========================================================================
  // Sibling merging
  // ===========================================================================

  /**
   * Merge `right` into a union with `left`.
   *
   * If `left` is already a union, `right` is appended to it and `left` is
   * returned. Otherwise a new two-member union is created.
   *
   * @throws AlreadyNestedError if `right` is `left` or contains it
   */
  UnionUnit * union_with(Unit * left, Unit * right);

  /// Same as union_with, producing a VectorUnit.
  VectorUnit * vector_with(Unit * left, Unit * right);

  /// @throws EmptyCombinatorError if `members` is empty
  UnionUnit * make_union(gsl::span<Unit * const> members);
  UnionUnit * make_union(std::initializer_list<Unit *> members);

  /// @throws EmptyCombinatorError if `members` is empty
  VectorUnit * make_vector(gsl::span<Unit * const> members);
  VectorUnit * make_vector(std::initializer_list<Unit *> members);

private:
  UnitContext & ctx_;
};

}  // namespace nestgeom
