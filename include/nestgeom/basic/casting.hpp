// nestgeom/basic/casting.hpp - LLVM-style kind checks for units and lattice specs
//
// Works with any hierarchy whose classes provide a static `classof`.
//
// Usage:
//   if (isa<UnionUnit>(unit)) { ... }
//   auto* cell = cast<NestedCellRef>(unit);          // asserts on failure
//   if (auto* vec = dyn_cast<VectorUnit>(unit)) { ... }  // nullptr on failure
//
#pragma once

#include <cassert>
#include <type_traits>

namespace nestgeom
{

namespace detail
{

/// Check if T has a classof static method accepting From
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

/**
 * Check whether a node is of type T.
 *
 * @return false for nullptr
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

/**
 * Cast a node to T. The node must be non-null and of type T.
 * Use dyn_cast when the kind is not known.
 */
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

/// Cast to T, or nullptr if the node is null or of another kind.
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace nestgeom
