// nestgeom/project/tally_config.hpp - Tally description files (YAML)
//
// A tally description file names the surfaces, cells and universes of a
// system together with their numbers, and lists tally units built from
// them:
//
//   system:
//     surfaces:  { wall: 1 }
//     cells:     { fuel: 10, clad: 11, assembly: 30 }
//     universes: { pin: 5 }
//   tallies:
//     - name: pin_flux
//       unit:
//         - vector: [{cell: fuel}, {cell: clad}]
//         - univ: pin
//         - ucell: assembly
//           lattice: { range: { x: [0, 16], y: [0, 16] } }
//
// A sequence is a nesting chain listed innermost first.
//
#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "nestgeom/render/registry.hpp"
#include "nestgeom/unit/unit.hpp"
#include "nestgeom/unit/unit_context.hpp"

namespace nestgeom
{

/**
 * One named tally unit. `unit` is the chain handle (innermost node) and is
 * owned by the UnitContext the document was loaded into.
 */
struct TallyDecl
{
  std::string name;
  Unit * unit = nullptr;
};

/**
 * Contents of a tally description file.
 */
struct TallyDocument
{
  SystemRegistry registry;
  std::vector<TallyDecl> tallies;

  /// File the document was loaded from (empty for in-memory sources)
  std::filesystem::path source_path;
};

/**
 * Result of loading a tally description.
 */
struct TallyLoadResult
{
  /// Loaded document (only valid if success == true)
  TallyDocument document;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static TallyLoadResult ok(TallyDocument doc)
  {
    TallyLoadResult r;
    r.document = std::move(doc);
    r.success = true;
    return r;
  }

  static TallyLoadResult fail(std::string msg)
  {
    TallyLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Load a tally description file.
 *
 * Units are created in `ctx`, which must outlive the returned document.
 * Library errors raised while building units (E001-E005) are reported as
 * load failures.
 */
[[nodiscard]] TallyLoadResult load_tally_file(
  const std::filesystem::path & path, UnitContext & ctx);

/// Load a tally description from YAML text.
[[nodiscard]] TallyLoadResult load_tally_string(const std::string & yaml, UnitContext & ctx);

}  // namespace nestgeom
