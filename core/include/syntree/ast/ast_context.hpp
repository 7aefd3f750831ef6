// syntree/ast/ast_context.hpp - Arena that owns a syntax tree and its source
//
// An AstContext owns the source buffer, every Token and every Node of one
// tree. Nodes are built bottom-up; placing a node in a slot of a new node
// wires its parent pointer. All memory is released with the context.
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <gsl/span>
#include <initializer_list>
#include <memory>
#include <memory_resource>
#include <new>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "syntree/ast/element.hpp"
#include "syntree/ast/node.hpp"
#include "syntree/basic/source_text.hpp"
#include "syntree/syntax/token.hpp"

namespace syntree
{

/**
 * Initial value of one slot, as passed to AstContext::create.
 *
 * Single slots take a Node, a Token or nullptr (absent). List slots take a
 * vector of elements, see element_list().
 */
class SlotInit
{
public:
  SlotInit(std::nullptr_t) noexcept {}                  // NOLINT(google-explicit-constructor)
  SlotInit(Node * node) noexcept : single_(node) {}      // NOLINT(google-explicit-constructor)
  SlotInit(const Token * token) noexcept : single_(token) {}  // NOLINT(google-explicit-constructor)
  SlotInit(Element element) noexcept : single_(element) {}    // NOLINT(google-explicit-constructor)
  SlotInit(std::vector<Element> list)                    // NOLINT(google-explicit-constructor)
  : is_list_(true), list_(std::move(list))
  {
  }

  [[nodiscard]] bool is_list() const noexcept { return is_list_; }
  [[nodiscard]] Element single() const noexcept { return single_; }
  [[nodiscard]] const std::vector<Element> & list() const noexcept { return list_; }

private:
  bool is_list_ = false;
  Element single_;
  std::vector<Element> list_;
};

/// Build the value of a list slot from nodes and tokens
template <typename... Ts>
[[nodiscard]] std::vector<Element> element_list(Ts... elements)
{
  return std::vector<Element>{Element(elements)...};
}

// ============================================================================
// AstContext - PMR Arena for one tree
// ============================================================================

/**
 * Context that owns a source buffer and all tokens and nodes built on it.
 *
 * Example:
 * @code
 *   AstContext ctx("x;");
 *   const Token * x = ctx.create_token(TokenKind::Name, 0, 0, 1);
 *   const Token * semi = ctx.create_token(TokenKind::Semicolon, 1, 1, 1);
 *   auto * name = ctx.create<NameExpression>({x});
 *   auto * stmt = ctx.create<ExpressionStatement>({name, semi});
 *   const Token * eof = ctx.create_token(TokenKind::EndOfFileToken, 2, 2, 0);
 *   auto * file = ctx.create<SourceFile>({element_list(stmt), eof});
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(SourceText source, size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), source_(std::move(source))
  {
  }

  explicit AstContext(std::string source, size_t initialBufferSize = k_default_buffer_size)
  : AstContext(SourceText(std::move(source)), initialBufferSize)
  {
  }

  ~AstContext() = default;

  // Non-copyable and non-movable (nodes point into the owned buffer)
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  [[nodiscard]] const SourceText & source() const noexcept { return source_; }
  [[nodiscard]] std::string_view file_contents() const noexcept { return source_.get_content(); }

  // ===========================================================================
  // Token Creation
  // ===========================================================================

  /**
   * Create a token. Offsets are not checked against the buffer; a malformed
   * token is reported by verify_tree().
   */
  const Token * create_token(TokenKind kind, uint32_t fullStart, uint32_t start, uint32_t length)
  {
    return create_token(Token{kind, fullStart, start, length});
  }

  const Token * create_token(const Token & token)
  {
    void * const mem = arena_.allocate(sizeof(Token), alignof(Token));
    ++tokenCount_;
    return new (mem) Token(token);
  }

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a node of type T with one initializer per slot, in slot order.
   *
   * Every node placed in a slot gets the new node as its parent.
   *
   * @throws std::invalid_argument if the number of initializers differs from
   *         the slot count, a single slot receives a list or vice versa, a
   *         list holds a null entry, or a child node already has a parent
   */
  template <typename T>
  T * create(std::initializer_list<SlotInit> slots)
  {
    static_assert(std::is_base_of_v<Node, T>, "T must derive from Node");

    // Ensure node is safe to manage by arena (no non-trivial destructor)
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Syntax node must be trivially destructible to be managed by the arena");

    const gsl::span<const SlotStorage> storage = build_slots(T::kind, slots);

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    T * const node = new (mem) T(storage, source_.get_content());

    attach_children(node);
    ++nodeCount_;
    return node;
  }

  [[nodiscard]] size_t node_count() const noexcept { return nodeCount_; }
  [[nodiscard]] size_t token_count() const noexcept { return tokenCount_; }

private:
  /// Validate initializers against the schema of `kind` and copy them into the arena
  gsl::span<const SlotStorage> build_slots(NodeKind kind, std::initializer_list<SlotInit> slots);

  void attach_children(Node * parent) noexcept;

  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  std::pmr::monotonic_buffer_resource arena_;
  SourceText source_;
  size_t nodeCount_ = 0;
  size_t tokenCount_ = 0;
};

}  // namespace syntree
