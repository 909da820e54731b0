// nestgeom/unit/unit.hpp - Tally unit and lattice spec node classes
//
// Units describe where in a nested geometry a tally is taken. Each unit is
// one nesting level; `up` points at the next level outward and `down` at the
// level nested directly inside. All nodes are owned by a UnitContext.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "nestgeom/basic/casting.hpp"
#include "nestgeom/unit/unit_enums.hpp"

namespace nestgeom
{

// ============================================================================
// Lattice Specs
// ============================================================================

/// Inclusive index bounds along one lattice axis. {0, 0} means "axis unused".
struct IndexBounds
{
  int64_t first = 0;
  int64_t last = 0;
};

/// One lattice element given by its (i, j, k) indices.
struct LatticeIndex3
{
  int64_t i = 0;
  int64_t j = 0;
  int64_t k = 0;
};

/**
 * Base class for lattice element selectors.
 *
 * A lattice spec has no links; it is attached to a NestedCellRef and
 * rendered as part of that cell.
 */
class LatticeSpec
{
public:
  const LatticeKind kind;

  LatticeSpec(const LatticeSpec &) = delete;
  LatticeSpec & operator=(const LatticeSpec &) = delete;
  LatticeSpec(LatticeSpec &&) = delete;
  LatticeSpec & operator=(LatticeSpec &&) = delete;

  [[nodiscard]] LatticeKind get_kind() const noexcept { return kind; }

protected:
  explicit LatticeSpec(LatticeKind k) : kind(k) {}
  ~LatticeSpec() = default;
};

template <typename Derived, LatticeKind K>
class LatticeSpecBase : public LatticeSpec
{
public:
  static constexpr LatticeKind kind_value = K;

  static bool classof(const LatticeSpec * spec) { return spec->get_kind() == K; }

protected:
  LatticeSpecBase() : LatticeSpec(K) {}
};

/// A single linear (1-D) lattice element index.
class LinearIndexSpec : public LatticeSpecBase<LinearIndexSpec, LatticeKind::LinearIndex>
{
public:
  int64_t index;

  explicit LinearIndexSpec(int64_t i) : index(i) {}
};

/// Axis-aligned ranges of lattice elements.
class IndexRangeSpec : public LatticeSpecBase<IndexRangeSpec, LatticeKind::IndexRange>
{
public:
  IndexBounds x;
  IndexBounds y;
  IndexBounds z;

  IndexRangeSpec(IndexBounds xb, IndexBounds yb, IndexBounds zb) : x(xb), y(yb), z(zb) {}
};

/// Explicit list of lattice element coordinates (never empty).
class CoordinateListSpec : public LatticeSpecBase<CoordinateListSpec, LatticeKind::Coordinates>
{
public:
  gsl::span<const LatticeIndex3> points;

  explicit CoordinateListSpec(gsl::span<const LatticeIndex3> p) : points(p) {}
};

// ============================================================================
// Units
// ============================================================================

/**
 * Base class for all tally unit nodes.
 *
 * Links are always set in pairs by UnitBuilder::join: if `a->up == b` then
 * `b->down == a`. Following either link terminates.
 */
class Unit
{
public:
  const UnitKind kind;

  /// Next nesting level outward (nullptr at the outermost level)
  Unit * up = nullptr;

  /// Level nested directly inside this one (nullptr at the innermost level)
  Unit * down = nullptr;

  Unit(const Unit &) = delete;
  Unit & operator=(const Unit &) = delete;
  Unit(Unit &&) = delete;
  Unit & operator=(Unit &&) = delete;

  [[nodiscard]] UnitKind get_kind() const noexcept { return kind; }

  [[nodiscard]] bool is_outermost() const noexcept { return up == nullptr; }
  [[nodiscard]] bool is_innermost() const noexcept { return down == nullptr; }

  /// Inner end of a chain with something above it: rendering opens a group here.
  [[nodiscard]] bool opens_group() const noexcept { return up != nullptr && down == nullptr; }

  /// Outer end of a chain with something below it: rendering closes the group.
  [[nodiscard]] bool closes_group() const noexcept { return down != nullptr && up == nullptr; }

protected:
  explicit Unit(UnitKind k) : kind(k) {}
  ~Unit() = default;  // Non-virtual, protected: nodes are arena-managed
};

/**
 * CRTP base implementing classof() for a concrete unit kind.
 */
template <typename Derived, UnitKind K>
class UnitBase : public Unit
{
public:
  static constexpr UnitKind kind_value = K;

  static bool classof(const Unit * unit) { return unit->get_kind() == K; }

protected:
  UnitBase() : Unit(K) {}
};

/// Reference to a surface of the system.
class SurfaceRef : public UnitBase<SurfaceRef, UnitKind::SurfaceRef>
{
public:
  std::string_view name;

  explicit SurfaceRef(std::string_view n) : name(n) {}
};

/// Reference to a cell at the lowest level of nesting.
class CellRef : public UnitBase<CellRef, UnitKind::CellRef>
{
public:
  std::string_view name;

  explicit CellRef(std::string_view n) : name(n) {}
};

/// Reference to a higher-level cell, optionally selecting lattice elements.
class NestedCellRef : public UnitBase<NestedCellRef, UnitKind::NestedCellRef>
{
public:
  std::string_view name;
  const LatticeSpec * latticeSpec = nullptr;

  explicit NestedCellRef(std::string_view n, const LatticeSpec * lat = nullptr)
  : name(n), latticeSpec(lat)
  {
  }
};

/// Reference to a universe.
class UniverseRef : public UnitBase<UniverseRef, UnitKind::UniverseRef>
{
public:
  std::string_view name;

  explicit UniverseRef(std::string_view n) : name(n) {}
};

/// Any one of the alternatives satisfies this nesting level.
class UnionUnit : public UnitBase<UnionUnit, UnitKind::Union>
{
public:
  gsl::span<Unit *> alternatives;

  explicit UnionUnit(gsl::span<Unit *> alts) : alternatives(alts) {}
};

/// One independent tally unit per element at this nesting level.
class VectorUnit : public UnitBase<VectorUnit, UnitKind::Vector>
{
public:
  gsl::span<Unit *> elements;

  explicit VectorUnit(gsl::span<Unit *> elems) : elements(elems) {}
};

/// Name of a leaf reference, or an empty view for combinators.
[[nodiscard]] std::string_view unit_name(const Unit * unit) noexcept;

/// Innermost node of the chain containing `unit` (follows `down`).
[[nodiscard]] Unit * innermost(Unit * unit) noexcept;
[[nodiscard]] const Unit * innermost(const Unit * unit) noexcept;

/// Outermost node of the chain containing `unit` (follows `up`).
[[nodiscard]] Unit * outermost(Unit * unit) noexcept;
[[nodiscard]] const Unit * outermost(const Unit * unit) noexcept;

/**
 * Number of independent tally units the chain starting at `unit` expands
 * to when written in multiple-bin form. Vector levels contribute the sum of
 * their members' counts; levels multiply.
 */
[[nodiscard]] uint64_t bin_count(const Unit * unit) noexcept;

}  // namespace nestgeom
