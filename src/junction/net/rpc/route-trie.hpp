#pragma once

#include "rpc-handler.hpp"

#include <tl/expected.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

namespace junction::net {

class RouteTrie;

// --------------------------------------------------------------------------------------- RouteNode

/**
 * @brief A node in the route trie. Only the owning `RouteTrie` can modify it.
 */
class RouteNode {
private:
  std::string name_{};
  std::unordered_map<std::string, std::unique_ptr<RouteNode>> children_{};
  RpcHandlerPtr handler_{nullptr};

  friend class RouteTrie;

  void bind_handler(RpcHandlerPtr handler) { handler_ = std::move(handler); }
  void clear() { children_.clear(); }

  RouteNode* find_child_(std::string_view name);
  RouteNode& get_or_create_child_(std::string_view name);
  std::unique_ptr<RouteNode> detach_child_(std::string_view name);

public:
  explicit RouteNode(std::string name = "") : name_{std::move(name)} {}
  RouteNode(const RouteNode&) = delete;
  RouteNode(RouteNode&&) = default;
  ~RouteNode() = default;
  RouteNode& operator=(const RouteNode&) = delete;
  RouteNode& operator=(RouteNode&&) = default;

  /** @brief The path segment of this node; only useful for debugging. */
  const std::string& name() const noexcept { return name_; }

  /** @brief The bound handler, or nullptr */
  const RpcHandlerPtr& handler() const noexcept { return handler_; }

  /** @brief Number of immediate children */
  std::size_t size() const noexcept { return children_.size(); }

  const RouteNode* find_child(std::string_view name) const;
};

// --------------------------------------------------------------------------------------- RouteTrie

/**
 * @brief Handlers addressed by dot-separated hierarchical keys, e.g., "chat.room.join".
 *
 * The root node is the trie itself, and is addressed by the empty key.
 * Nodes are created lazily by `insert`, and only destroyed by `remove`, which drops the
 * whole subtree.
 * @note Not threadsafe.
 */
class RouteTrie {
private:
  RouteNode root_{};

  const RouteNode* find_node_(std::string_view path) const;

public:
  static constexpr char k_delimiter = '.';

  /**
   * @brief Bind `handler` to `path`, creating any missing nodes along the way. Overwrites the
   *        handler previously bound at exactly `path`.
   * @return `ecode::argument_error` if `path` is empty or `handler` is null.
   */
  std::error_code insert(std::string_view path, RpcHandlerPtr handler);

  /**
   * @brief The handler at `path`; the empty path is the root's handler.
   * @return `ecode::no_such_route` if a path segment is missing. Note that the node can exist
   *         without a handler, in which case the result holds nullptr. Callers treat that the
   *         same as `no_such_route`: there is no handler to call, and `RpcDispatcher` drops the
   *         envelope.
   */
  tl::expected<RpcHandlerPtr, std::error_code> lookup(std::string_view path) const;

  /**
   * @brief Detach the node at `path` (and thus its subtree) from its parent.
   * @return false if `path` is empty or does not exist.
   */
  bool remove(std::string_view path);

  /** @brief The node at `path`, or nullptr */
  const RouteNode* find(std::string_view path) const { return find_node_(path); }

  void bind_root(RpcHandlerPtr handler) { root_.bind_handler(std::move(handler)); }
  const RpcHandlerPtr& root_handler() const noexcept { return root_.handler(); }
  const RouteNode& root() const noexcept { return root_; }

  /** @brief Remove every route; the root handler stays bound. */
  void clear() { root_.clear(); }
};

} // namespace junction::net
