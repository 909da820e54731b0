// nestgeom/render/registry.hpp - Name to number lookup in a system definition
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

#include "nestgeom/basic/error.hpp"

namespace nestgeom
{

/**
 * Lookup of the numeric identifiers the simulation input uses for named
 * surfaces, cells and universes.
 *
 * Every query throws NameNotFoundError for an unknown name. Implementations
 * must never return a placeholder number.
 */
class Registry
{
public:
  virtual ~Registry() = default;

  [[nodiscard]] virtual int64_t surface_number(std::string_view name) const = 0;
  [[nodiscard]] virtual int64_t cell_number(std::string_view name) const = 0;
  [[nodiscard]] virtual int64_t universe_number(std::string_view name) const = 0;

protected:
  Registry() = default;
  Registry(const Registry &) = default;
  Registry & operator=(const Registry &) = default;
  Registry(Registry &&) = default;
  Registry & operator=(Registry &&) = default;
};

/// Transparent hash functor for string_view heterogeneous lookup
struct RegistryHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct RegistryEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * In-memory registry holding three name tables.
 *
 * Tables are filled with define_*; a name may be defined once per table.
 * Table keys view names owned by the registry, so it is movable but not
 * copyable.
 */
class SystemRegistry : public Registry
{
public:
  SystemRegistry() = default;
  ~SystemRegistry() override = default;

  SystemRegistry(const SystemRegistry &) = delete;
  SystemRegistry & operator=(const SystemRegistry &) = delete;
  SystemRegistry(SystemRegistry &&) = default;
  SystemRegistry & operator=(SystemRegistry &&) = default;

  /// @return false if the surface name already exists
  bool define_surface(std::string_view name, int64_t number);
  /// @return false if the cell name already exists
  bool define_cell(std::string_view name, int64_t number);
  /// @return false if the universe name already exists
  bool define_universe(std::string_view name, int64_t number);

  [[nodiscard]] int64_t surface_number(std::string_view name) const override;
  [[nodiscard]] int64_t cell_number(std::string_view name) const override;
  [[nodiscard]] int64_t universe_number(std::string_view name) const override;

  [[nodiscard]] bool contains(NameSpace ns, std::string_view name) const;
  [[nodiscard]] size_t size(NameSpace ns) const noexcept;

private:
  using Table = std::unordered_map<std::string_view, int64_t, RegistryHash, RegistryEqual>;

  [[nodiscard]] Table & table(NameSpace ns) noexcept;
  [[nodiscard]] const Table & table(NameSpace ns) const noexcept;
  bool define(NameSpace ns, std::string_view name, int64_t number);
  [[nodiscard]] int64_t lookup(NameSpace ns, std::string_view name) const;

  /// Owns the key storage of all three tables (node addresses are stable)
  std::unordered_set<std::string> names_;

  Table surfaces_;
  Table cells_;
  Table universes_;
};

}  // namespace nestgeom
