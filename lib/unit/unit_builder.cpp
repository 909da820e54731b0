// nestgeom/unit/unit_builder.cpp - Unit construction, nesting and merging
#include "nestgeom/unit/unit_builder.hpp"

#include <fmt/core.h>

#include <string>

#include "nestgeom/basic/error.hpp"

namespace nestgeom
{

namespace
{

[[nodiscard]] std::string describe(const Unit * unit)
{
  const std::string_view name = unit_name(unit);
  if (name.empty()) {
    return std::string(to_string(unit->get_kind()));
  }
  return fmt::format("{} '{}'", to_string(unit->get_kind()), name);
}

/// Members of a union or vector; empty for every other kind.
[[nodiscard]] gsl::span<Unit * const> members_of(const Unit * unit)
{
  if (const auto * u = dyn_cast<UnionUnit>(unit)) return u->alternatives;
  if (const auto * v = dyn_cast<VectorUnit>(unit)) return v->elements;
  return {};
}

/**
 * True if rendering `from` would visit `target`: walks outward through `up`
 * and into combinator members, the two edges the renderers follow.
 */
[[nodiscard]] bool reaches(const Unit * from, const Unit * target)
{
  for (const Unit * level = from; level != nullptr; level = level->up) {
    if (level == target) {
      return true;
    }
    for (const Unit * member : members_of(level)) {
      if (reaches(member, target)) {
        return true;
      }
    }
  }
  return false;
}

/// True if any level of the chain ending at `top` is reachable from `from`.
[[nodiscard]] bool reaches_chain(const Unit * from, const Unit * top)
{
  for (const Unit * level = top; level != nullptr; level = level->down) {
    if (reaches(from, level)) {
      return true;
    }
  }
  return false;
}

}  // namespace

// ============================================================================
// Leaf references
// ============================================================================

SurfaceRef * UnitBuilder::surf(std::string_view name)
{
  return ctx_.create<SurfaceRef>(ctx_.intern(name));
}

CellRef * UnitBuilder::cell(std::string_view name)
{
  return ctx_.create<CellRef>(ctx_.intern(name));
}

NestedCellRef * UnitBuilder::ucell(std::string_view name, const LatticeSpec * lattice)
{
  return ctx_.create<NestedCellRef>(ctx_.intern(name), lattice);
}

UniverseRef * UnitBuilder::univ(std::string_view name)
{
  return ctx_.create<UniverseRef>(ctx_.intern(name));
}

// ============================================================================
// Lattice specs
// ============================================================================

LinearIndexSpec * UnitBuilder::lattice_index(int64_t index)
{
  return ctx_.create<LinearIndexSpec>(index);
}

IndexRangeSpec * UnitBuilder::lattice_range(IndexBounds x, IndexBounds y, IndexBounds z)
{
  return ctx_.create<IndexRangeSpec>(x, y, z);
}

CoordinateListSpec * UnitBuilder::lattice_coords(LatticeIndex3 point)
{
  return lattice_coords(gsl::span<const LatticeIndex3>(&point, 1));
}

CoordinateListSpec * UnitBuilder::lattice_coords(gsl::span<const LatticeIndex3> points)
{
  if (points.empty()) {
    throw EmptyLatticeSelectionError("lattice coordinate list must contain at least one point");
  }
  const gsl::span<LatticeIndex3> stored = ctx_.copy_to_arena<LatticeIndex3>(points);
  return ctx_.create<CoordinateListSpec>(stored);
}

CoordinateListSpec * UnitBuilder::lattice_coords(std::initializer_list<LatticeIndex3> points)
{
  return lattice_coords(gsl::span<const LatticeIndex3>(points.begin(), points.size()));
}

NestedCellRef * UnitBuilder::attach_lattice(Unit * unit, const LatticeSpec * lattice)
{
  auto * cell = dyn_cast<NestedCellRef>(unit);
  if (cell == nullptr) {
    throw InvalidLatticeAttachmentError(fmt::format(
      "lattice spec can only be attached to a nested cell, not to {}",
      unit ? describe(unit) : std::string("null")));
  }
  if (cell->latticeSpec != nullptr) {
    throw InvalidLatticeAttachmentError(
      fmt::format("{} already has a lattice spec", describe(cell)));
  }
  cell->latticeSpec = lattice;
  return cell;
}

// ============================================================================
// Nesting
// ============================================================================

Unit * UnitBuilder::join(Unit * inner, Unit * outer)
{
  Unit * const top = outermost(inner);

  if (outer->down != nullptr) {
    throw AlreadyNestedError(fmt::format(
      "{} already contains {}; cannot also nest {} in it", describe(outer),
      describe(outer->down), describe(top)));
  }
  if (outermost(outer) == top) {
    throw AlreadyNestedError(fmt::format(
      "{} and {} are already levels of the same chain", describe(inner), describe(outer)));
  }
  if (reaches_chain(outer, top)) {
    throw AlreadyNestedError(fmt::format(
      "{} already contains {} as a member; nesting would form a cycle", describe(outer),
      describe(inner)));
  }

  top->up = outer;
  outer->down = top;
  return innermost(inner);
}

Unit * UnitBuilder::chain(gsl::span<Unit * const> levels)
{
  if (levels.empty()) {
    throw EmptyCombinatorError("nesting chain must contain at least one level");
  }
  Unit * handle = levels[0];
  for (size_t i = 1; i < levels.size(); ++i) {
    handle = join(handle, levels[i]);
  }
  return handle;
}

Unit * UnitBuilder::chain(std::initializer_list<Unit *> levels)
{
  return chain(gsl::span<Unit * const>(levels.begin(), levels.size()));
}

// ============================================================================
// Sibling merging
// ============================================================================

UnionUnit * UnitBuilder::union_with(Unit * left, Unit * right)
{
  if (reaches(right, left)) {
    throw AlreadyNestedError(
      fmt::format("{} already contains {}; merging would form a cycle", describe(right), describe(left)));
  }
  if (auto * existing = dyn_cast<UnionUnit>(left)) {
    existing->alternatives = ctx_.append_to_arena(existing->alternatives, right);
    return existing;
  }
  return make_union({left, right});
}

VectorUnit * UnitBuilder::vector_with(Unit * left, Unit * right)
{
  if (reaches(right, left)) {
    throw AlreadyNestedError(
      fmt::format("{} already contains {}; merging would form a cycle", describe(right), describe(left)));
  }
  if (auto * existing = dyn_cast<VectorUnit>(left)) {
    existing->elements = ctx_.append_to_arena(existing->elements, right);
    return existing;
  }
  return make_vector({left, right});
}

UnionUnit * UnitBuilder::make_union(gsl::span<Unit * const> members)
{
  if (members.empty()) {
    throw EmptyCombinatorError("union must contain at least one alternative");
  }
  return ctx_.create<UnionUnit>(ctx_.copy_to_arena<Unit *>(members));
}

UnionUnit * UnitBuilder::make_union(std::initializer_list<Unit *> members)
{
  return make_union(gsl::span<Unit * const>(members.begin(), members.size()));
}

VectorUnit * UnitBuilder::make_vector(gsl::span<Unit * const> members)
{
  if (members.empty()) {
    throw EmptyCombinatorError("vector must contain at least one element");
  }
  return ctx_.create<VectorUnit>(ctx_.copy_to_arena<Unit *>(members));
}

VectorUnit * UnitBuilder::make_vector(std::initializer_list<Unit *> members)
{
  return make_vector(gsl::span<Unit * const>(members.begin(), members.size()));
}

}  // namespace nestgeom
