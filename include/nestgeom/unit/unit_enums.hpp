// nestgeom/unit/unit_enums.hpp - Kind enumerations for units and lattice specs
#pragma once

#include <cstdint>
#include <string_view>

namespace nestgeom
{

/**
 * Unit kind for LLVM-style RTTI.
 * Auto-generated from unit_nodes.def.
 */
enum class UnitKind : uint8_t {
#define UNIT_NODE(Class, Kind, Snake) Kind,
#include "nestgeom/unit/unit_nodes.def"
};

/// Lattice element selector kind.
enum class LatticeKind : uint8_t {
#define LATTICE_SPEC(Class, Kind) Kind,
#include "nestgeom/unit/unit_nodes.def"
};

/// Class name of a unit kind ("SurfaceRef", "Union", ...).
[[nodiscard]] constexpr std::string_view to_string(UnitKind k) noexcept
{
  switch (k) {
    case UnitKind::SurfaceRef:
      return "SurfaceRef";
    case UnitKind::CellRef:
      return "CellRef";
    case UnitKind::NestedCellRef:
      return "NestedCellRef";
    case UnitKind::UniverseRef:
      return "UniverseRef";
    case UnitKind::Union:
      return "Union";
    case UnitKind::Vector:
      return "Vector";
  }
  return "Unknown";
}

[[nodiscard]] constexpr std::string_view to_string(LatticeKind k) noexcept
{
  switch (k) {
    case LatticeKind::LinearIndex:
      return "LinearIndex";
    case LatticeKind::IndexRange:
      return "IndexRange";
    case LatticeKind::Coordinates:
      return "Coordinates";
  }
  return "Unknown";
}

}  // namespace nestgeom
