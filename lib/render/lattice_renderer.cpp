// nestgeom/render/lattice_renderer.cpp - Lattice element selector text
#include <fmt/core.h>

#include <string>

#include "nestgeom/render/renderer.hpp"

namespace nestgeom
{

std::string lattice_comment(const LatticeSpec & spec)
{
  switch (spec.get_kind()) {
    case LatticeKind::LinearIndex: {
      const auto & lin = static_cast<const LinearIndexSpec &>(spec);
      return fmt::format("linear idx {}", lin.index);
    }
    case LatticeKind::IndexRange: {
      const auto & rng = static_cast<const IndexRangeSpec &>(spec);
      return fmt::format(
        "x range {}:{}, y range {}:{}, z range {}:{}", rng.x.first, rng.x.last, rng.y.first,
        rng.y.last, rng.z.first, rng.z.last);
    }
    case LatticeKind::Coordinates: {
      const auto & cor = static_cast<const CoordinateListSpec &>(spec);
      std::string out = "coords";
      for (size_t n = 0; n < cor.points.size(); ++n) {
        const LatticeIndex3 & p = cor.points[n];
        out += fmt::format(" ({}, {}, {})", p.i, p.j, p.k);
        if (n + 1 < cor.points.size()) {
          out += ",";
        }
      }
      return out;
    }
  }
  return {};
}

std::string lattice_wire(const LatticeSpec & spec)
{
  switch (spec.get_kind()) {
    case LatticeKind::LinearIndex:
      return fmt::format("{}", static_cast<const LinearIndexSpec &>(spec).index);
    case LatticeKind::IndexRange: {
      const auto & rng = static_cast<const IndexRangeSpec &>(spec);
      return fmt::format(
        "{}:{} {}:{} {}:{}", rng.x.first, rng.x.last, rng.y.first, rng.y.last, rng.z.first,
        rng.z.last);
    }
    case LatticeKind::Coordinates: {
      const auto & cor = static_cast<const CoordinateListSpec &>(spec);
      std::string out;
      for (size_t n = 0; n < cor.points.size(); ++n) {
        const LatticeIndex3 & p = cor.points[n];
        out += fmt::format(" {} {} {}", p.i, p.j, p.k);
        if (n + 1 < cor.points.size()) {
          out += ",";
        }
      }
      return out;
    }
  }
  return {};
}

}  // namespace nestgeom
