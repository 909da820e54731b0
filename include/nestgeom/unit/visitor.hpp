// nestgeom/unit/visitor.hpp - CRTP visitor over the closed set of unit kinds
#pragma once

#include "nestgeom/basic/casting.hpp"
#include "nestgeom/unit/unit.hpp"
#include "nestgeom/unit/unit_enums.hpp"

namespace nestgeom
{

/**
 * CRTP visitor dispatching on UnitKind. Units are visited read-only.
 *
 * The derived class implements visit_<snake>() for the kinds it cares
 * about; the rest fall back to visit_unit(). Dispatch is a switch, no
 * virtual calls.
 *
 * @code
 *   class NameCollector : public ConstUnitVisitor<NameCollector> {
 *   public:
 *     void visit_cell_ref(const CellRef* c) { names.push_back(c->name); }
 *     std::vector<std::string_view> names;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType Return type of the visit methods
 */
template <typename Derived, typename ReturnType = void>
class ConstUnitVisitor
{
public:
  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  /// Visit a unit, dispatching to the visit method for its kind.
  ReturnType visit(const Unit * unit)
  {
    if (!unit) {
      return ReturnType();
    }

    switch (unit->kind) {
#define UNIT_NODE(Class, Kind, Snake) \
  case UnitKind::Kind:                \
    return get_derived().visit_##Snake(cast<Class>(unit));
#include "nestgeom/unit/unit_nodes.def"
    }

    return ReturnType();
  }

#define UNIT_NODE(Class, Kind, Snake)          \
  ReturnType visit_##Snake(const Class * unit) \
  {                                            \
    return get_derived().visit_unit(unit);     \
  }
#include "nestgeom/unit/unit_nodes.def"

  /// Base case - does nothing by default
  ReturnType visit_unit(const Unit * /*unit*/) { return ReturnType(); }
};

}  // namespace nestgeom
