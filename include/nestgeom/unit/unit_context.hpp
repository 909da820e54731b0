// nestgeom/unit/unit_context.hpp - Arena owning unit nodes and names
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>

#include "nestgeom/unit/unit.hpp"

namespace nestgeom
{

/**
 * Context that owns all units, lattice specs, member arrays and interned
 * names of one or more unit graphs.
 *
 * Everything created through the context stays valid until the context is
 * destroyed. Nothing is freed individually; links between nodes are plain
 * pointers into the arena, so chains never own each other.
 *
 * Example:
 * @code
 *   UnitContext ctx;
 *   auto* cell = ctx.create<CellRef>(ctx.intern("fuel"));
 * @endcode
 */
class UnitContext
{
public:
  /// Default initial buffer size (16KB)
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit UnitContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), namePool_(&arena_)
  {
  }

  ~UnitContext() = default;

  // PMR resources are neither copyable nor movable
  UnitContext(const UnitContext &) = delete;
  UnitContext & operator=(const UnitContext &) = delete;
  UnitContext(UnitContext &&) = delete;
  UnitContext & operator=(UnitContext &&) = delete;

  /**
   * Create a unit or lattice spec of type T in the arena.
   *
   * @return Non-owning pointer, valid for the lifetime of the context
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(
      std::is_base_of_v<Unit, T> || std::is_base_of_v<LatticeSpec, T>,
      "T must derive from Unit or LatticeSpec");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Arena-managed nodes must be trivially destructible. "
      "Use std::string_view and gsl::span for payloads.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /**
   * Intern a name and return a view that lives as long as the context.
   * Equal names share storage.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = namePool_.find(s);
    if (it != namePool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    namePool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return namePool_.find(s) != namePool_.end();
  }

  /// Allocate a value-initialized array of `size` elements in the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy a range of elements into a new arena array.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(gsl::span<const T> src)
  {
    auto span = allocate_array<T>(src.size());
    std::uninitialized_copy(src.begin(), src.end(), span.begin());
    return span;
  }

  /**
   * Return a new arena array holding `src` followed by `extra`.
   * The old array is left in place (the arena never frees).
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> append_to_arena(gsl::span<T> src, T extra)
  {
    auto span = allocate_array<T>(src.size() + 1);
    std::uninitialized_copy(src.begin(), src.end(), span.begin());
    span[src.size()] = extra;
    return span;
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> namePool_;
};

}  // namespace nestgeom
