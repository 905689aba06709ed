// reactc/ast/ast_context.hpp - AST arena allocator
//
// Owns every node of one parsed file. Uses std::pmr::monotonic_buffer_resource:
// nodes are never freed individually, only when the context dies.
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <type_traits>
#include <utility>
#include <vector>

namespace reactc
{

class AstNode;

/**
 * Arena for AST nodes and node lists.
 *
 * Node text (identifier names, literal raws) is not copied: nodes hold
 * string_views into the SourceFile, which must outlive the context.
 *
 * @code
 *   AstContext ctx;
 *   auto * id = ctx.create<Identifier>(name, range);
 *   auto args = ctx.copy_to_arena(arg_vector);
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size)
  {
  }

  ~AstContext() = default;

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /// Construct a node of type T in the arena and return a non-owning pointer.
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    ++node_count_;
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Copy a temporary vector into an arena-owned span.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    if (vec.empty()) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * vec.size(), alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_copy(vec.begin(), vec.end(), ptr);
    return gsl::span<T>(ptr, vec.size());
  }

  [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

private:
  std::pmr::monotonic_buffer_resource arena_;
  size_t node_count_ = 0;
};

}  // namespace reactc
