// nestgeom/project/tally_config.cpp - Tally description loading
//
#include "nestgeom/project/tally_config.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "nestgeom/basic/error.hpp"
#include "nestgeom/unit/unit_builder.hpp"

namespace nestgeom
{

namespace
{

constexpr std::array<std::string_view, 6> k_unit_keys = {
  "surf", "cell", "ucell", "univ", "union", "vector"};

/// Read an integer scalar
std::optional<int64_t> parse_int(const YAML::Node & node, const std::string & where, std::string & error)
{
  if (!node.IsScalar()) {
    error = where + ": expected an integer";
    return std::nullopt;
  }
  try {
    return node.as<int64_t>();
  } catch (const YAML::BadConversion &) {
    error = fmt::format("{}: '{}' is not an integer", where, node.Scalar());
    return std::nullopt;
  }
}

/// Read a name scalar
std::optional<std::string> parse_name(
  const YAML::Node & node, const std::string & where, std::string & error)
{
  if (!node.IsScalar() || node.Scalar().empty()) {
    error = where + ": expected a non-empty name";
    return std::nullopt;
  }
  return node.Scalar();
}

/// Parse one registry table ({name: number, ...})
bool parse_table(
  const YAML::Node & node, const std::string & where, NameSpace ns, SystemRegistry & registry,
  std::string & error)
{
  if (!node.IsMap()) {
    error = where + " must be a map of names to numbers";
    return false;
  }
  for (const auto & entry : node) {
    const std::string name = entry.first.as<std::string>();
    const auto number = parse_int(entry.second, where + "." + name, error);
    if (!number) {
      return false;
    }

    bool inserted = false;
    switch (ns) {
      case NameSpace::Surface:
        inserted = registry.define_surface(name, *number);
        break;
      case NameSpace::Cell:
        inserted = registry.define_cell(name, *number);
        break;
      case NameSpace::Universe:
        inserted = registry.define_universe(name, *number);
        break;
    }
    if (!inserted) {
      error = fmt::format("{}: duplicate {} name '{}'", where, to_string(ns), name);
      return false;
    }
  }
  return true;
}

std::optional<IndexBounds> parse_bounds(
  const YAML::Node & node, const std::string & where, std::string & error)
{
  if (!node) {
    return IndexBounds{};
  }
  if (!node.IsSequence() || node.size() != 2) {
    error = where + ": expected [first, last]";
    return std::nullopt;
  }
  const auto first = parse_int(node[0], where, error);
  const auto last = parse_int(node[1], where, error);
  if (!first || !last) {
    return std::nullopt;
  }
  return IndexBounds{*first, *last};
}

std::optional<LatticeIndex3> parse_point(
  const YAML::Node & node, const std::string & where, std::string & error)
{
  if (!node.IsSequence() || node.size() != 3) {
    error = where + ": expected [i, j, k]";
    return std::nullopt;
  }
  const auto i = parse_int(node[0], where, error);
  const auto j = parse_int(node[1], where, error);
  const auto k = parse_int(node[2], where, error);
  if (!i || !j || !k) {
    return std::nullopt;
  }
  return LatticeIndex3{*i, *j, *k};
}

const LatticeSpec * parse_lattice(
  const YAML::Node & node, const std::string & where, UnitBuilder & builder, std::string & error)
{
  if (!node.IsMap() || node.size() != 1) {
    error = where + ": lattice must have exactly one of 'index', 'range' or 'coords'";
    return nullptr;
  }

  if (node["index"]) {
    const auto index = parse_int(node["index"], where + ".index", error);
    return index ? builder.lattice_index(*index) : nullptr;
  }

  if (node["range"]) {
    const YAML::Node & rng = node["range"];
    if (!rng.IsMap()) {
      error = where + ".range must be a map with 'x', 'y' and/or 'z'";
      return nullptr;
    }
    for (const auto & axis : rng) {
      const std::string key = axis.first.as<std::string>();
      if (key != "x" && key != "y" && key != "z") {
        error = fmt::format("{}.range: unknown axis '{}'", where, key);
        return nullptr;
      }
    }
    const auto x = parse_bounds(rng["x"], where + ".range.x", error);
    const auto y = parse_bounds(rng["y"], where + ".range.y", error);
    const auto z = parse_bounds(rng["z"], where + ".range.z", error);
    if (!x || !y || !z) {
      return nullptr;
    }
    return builder.lattice_range(*x, *y, *z);
  }

  if (node["coords"]) {
    const YAML::Node & coords = node["coords"];
    if (!coords.IsSequence()) {
      error = where + ".coords must be a list";
      return nullptr;
    }
    // A single point may be written without the outer list
    if (coords.size() > 0 && coords[0].IsScalar()) {
      const auto point = parse_point(coords, where + ".coords", error);
      return point ? builder.lattice_coords(*point) : nullptr;
    }
    std::vector<LatticeIndex3> points;
    for (size_t i = 0; i < coords.size(); ++i) {
      const auto point = parse_point(coords[i], fmt::format("{}.coords[{}]", where, i), error);
      if (!point) {
        return nullptr;
      }
      points.push_back(*point);
    }
    return builder.lattice_coords(gsl::span<const LatticeIndex3>(points.data(), points.size()));
  }

  error = where + ": lattice must have exactly one of 'index', 'range' or 'coords'";
  return nullptr;
}

Unit * parse_unit(
  const YAML::Node & node, const std::string & where, UnitBuilder & builder, std::string & error);

std::optional<std::vector<Unit *>> parse_members(
  const YAML::Node & node, const std::string & where, UnitBuilder & builder, std::string & error)
{
  if (!node.IsSequence()) {
    error = where + " must be a list";
    return std::nullopt;
  }
  std::vector<Unit *> members;
  for (size_t i = 0; i < node.size(); ++i) {
    Unit * member = parse_unit(node[i], fmt::format("{}[{}]", where, i), builder, error);
    if (!member) {
      return std::nullopt;
    }
    members.push_back(member);
  }
  return members;
}

Unit * parse_unit_map(
  const YAML::Node & node, const std::string & where, UnitBuilder & builder, std::string & error)
{
  std::string_view kind;
  for (const auto & entry : node) {
    const std::string key = entry.first.as<std::string>();
    if (key == "lattice") {
      continue;
    }
    bool known = false;
    for (const std::string_view k : k_unit_keys) {
      if (key == k) {
        known = true;
        if (!kind.empty()) {
          error = fmt::format("{}: both '{}' and '{}' given", where, kind, key);
          return nullptr;
        }
        kind = k;
      }
    }
    if (!known) {
      error = fmt::format("{}: unknown unit key '{}'", where, key);
      return nullptr;
    }
  }
  if (kind.empty()) {
    error = where + ": expected one of surf, cell, ucell, univ, union, vector";
    return nullptr;
  }

  const YAML::Node & value = node[std::string(kind)];
  const std::string value_where = fmt::format("{}.{}", where, kind);
  Unit * unit = nullptr;

  if (kind == "union" || kind == "vector") {
    auto members = parse_members(value, value_where, builder, error);
    if (!members) {
      return nullptr;
    }
    const gsl::span<Unit * const> span(members->data(), members->size());
    unit = kind == "union" ? static_cast<Unit *>(builder.make_union(span))
                           : static_cast<Unit *>(builder.make_vector(span));
  } else {
    const auto name = parse_name(value, value_where, error);
    if (!name) {
      return nullptr;
    }
    if (kind == "surf") {
      unit = builder.surf(*name);
    } else if (kind == "cell") {
      unit = builder.cell(*name);
    } else if (kind == "ucell") {
      unit = builder.ucell(*name);
    } else {
      unit = builder.univ(*name);
    }
  }

  if (node["lattice"]) {
    const LatticeSpec * lattice = parse_lattice(node["lattice"], where + ".lattice", builder, error);
    if (!lattice) {
      return nullptr;
    }
    builder.attach_lattice(unit, lattice);
  }

  return unit;
}

Unit * parse_unit(
  const YAML::Node & node, const std::string & where, UnitBuilder & builder, std::string & error)
{
  if (node.IsMap()) {
    return parse_unit_map(node, where, builder, error);
  }

  if (node.IsSequence()) {
    auto levels = parse_members(node, where, builder, error);
    if (!levels) {
      return nullptr;
    }
    return builder.chain(gsl::span<Unit * const>(levels->data(), levels->size()));
  }

  error = where + ": expected a unit map or a nesting list";
  return nullptr;
}

TallyLoadResult load_document(const YAML::Node & root, UnitContext & ctx)
{
  if (!root.IsMap()) {
    return TallyLoadResult::fail("top level must be a map with 'system' and 'tallies'");
  }

  TallyDocument doc;
  std::string error;

  // Parse 'system' section
  if (const YAML::Node system = root["system"]) {
    for (const NameSpace ns : {NameSpace::Surface, NameSpace::Cell, NameSpace::Universe}) {
      const std::string key(table_key(ns));
      if (system[key] && !parse_table(system[key], "system." + key, ns, doc.registry, error)) {
        return TallyLoadResult::fail(error);
      }
    }
  }

  // Parse 'tallies' section
  const YAML::Node tallies = root["tallies"];
  if (!tallies) {
    return TallyLoadResult::ok(std::move(doc));
  }
  if (!tallies.IsSequence()) {
    return TallyLoadResult::fail("tallies must be a list");
  }

  UnitBuilder builder(ctx);
  std::unordered_set<std::string> seen;

  for (size_t i = 0; i < tallies.size(); ++i) {
    const YAML::Node & entry = tallies[i];
    const std::string where = fmt::format("tallies[{}]", i);

    if (!entry.IsMap() || !entry["name"] || !entry["unit"]) {
      return TallyLoadResult::fail(where + " must have 'name' and 'unit'");
    }
    const auto name = parse_name(entry["name"], where + ".name", error);
    if (!name) {
      return TallyLoadResult::fail(error);
    }
    if (!seen.insert(*name).second) {
      return TallyLoadResult::fail(fmt::format("{}: duplicate tally name '{}'", where, *name));
    }

    try {
      Unit * unit = parse_unit(entry["unit"], where + ".unit", builder, error);
      if (!unit) {
        return TallyLoadResult::fail(error);
      }
      doc.tallies.push_back(TallyDecl{*name, unit});
    } catch (const NestError & e) {
      return TallyLoadResult::fail(
        fmt::format("{} ({}): {}", where, error_code_string(e.code()), e.what()));
    }
  }

  return TallyLoadResult::ok(std::move(doc));
}

}  // namespace

TallyLoadResult load_tally_string(const std::string & yaml, UnitContext & ctx)
{
  try {
    return load_document(YAML::Load(yaml), ctx);
  } catch (const YAML::Exception & e) {
    return TallyLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

TallyLoadResult load_tally_file(const std::filesystem::path & path, UnitContext & ctx)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return TallyLoadResult::fail("tally file not found: " + path.string());
  }

  TallyLoadResult result;
  try {
    result = load_document(YAML::LoadFile(path.string()), ctx);
  } catch (const YAML::Exception & e) {
    return TallyLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (result.success) {
    result.document.source_path = fs::absolute(path);
  }
  return result;
}

}  // namespace nestgeom
