// nestgeom/render/registry.cpp - In-memory system registry
#include "nestgeom/render/registry.hpp"

#include <string>

namespace nestgeom
{

bool SystemRegistry::define_surface(std::string_view name, int64_t number)
{
  return define(NameSpace::Surface, name, number);
}

bool SystemRegistry::define_cell(std::string_view name, int64_t number)
{
  return define(NameSpace::Cell, name, number);
}

bool SystemRegistry::define_universe(std::string_view name, int64_t number)
{
  return define(NameSpace::Universe, name, number);
}

int64_t SystemRegistry::surface_number(std::string_view name) const
{
  return lookup(NameSpace::Surface, name);
}

int64_t SystemRegistry::cell_number(std::string_view name) const
{
  return lookup(NameSpace::Cell, name);
}

int64_t SystemRegistry::universe_number(std::string_view name) const
{
  return lookup(NameSpace::Universe, name);
}

bool SystemRegistry::contains(NameSpace ns, std::string_view name) const
{
  const Table & t = table(ns);
  return t.find(name) != t.end();
}

size_t SystemRegistry::size(NameSpace ns) const noexcept { return table(ns).size(); }

bool SystemRegistry::define(NameSpace ns, std::string_view name, int64_t number)
{
  Table & t = table(ns);
  if (t.find(name) != t.end()) {
    return false;
  }
  const std::string & stored = *names_.emplace(name).first;
  t.emplace(stored, number);
  return true;
}

SystemRegistry::Table & SystemRegistry::table(NameSpace ns) noexcept
{
  switch (ns) {
    case NameSpace::Surface:
      return surfaces_;
    case NameSpace::Cell:
      return cells_;
    case NameSpace::Universe:
      return universes_;
  }
  return surfaces_;
}

const SystemRegistry::Table & SystemRegistry::table(NameSpace ns) const noexcept
{
  switch (ns) {
    case NameSpace::Surface:
      return surfaces_;
    case NameSpace::Cell:
      return cells_;
    case NameSpace::Universe:
      return universes_;
  }
  return surfaces_;
}

int64_t SystemRegistry::lookup(NameSpace ns, std::string_view name) const
{
  const Table & t = table(ns);
  auto it = t.find(name);
  if (it == t.end()) {
    throw NameNotFoundError(ns, std::string(name));
  }
  return it->second;
}

}  // namespace nestgeom
