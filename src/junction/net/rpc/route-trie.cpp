#include "stdinc.hpp"

#include "route-trie.hpp"

#include "junction/utils/string-utils.hpp"

namespace junction::net {

// --------------------------------------------------------------------------------------- RouteNode

RouteNode* RouteNode::find_child_(std::string_view name) {
  auto ii = children_.find(std::string{name});
  return (ii == cend(children_)) ? nullptr : ii->second.get();
}

const RouteNode* RouteNode::find_child(std::string_view name) const {
  auto ii = children_.find(std::string{name});
  return (ii == cend(children_)) ? nullptr : ii->second.get();
}

RouteNode& RouteNode::get_or_create_child_(std::string_view name) {
  auto& child = children_[std::string{name}];
  if (child == nullptr)
    child = std::make_unique<RouteNode>(std::string{name});
  return *child;
}

std::unique_ptr<RouteNode> RouteNode::detach_child_(std::string_view name) {
  auto ii = children_.find(std::string{name});
  if (ii == end(children_))
    return nullptr;
  auto child = std::move(ii->second);
  children_.erase(ii);
  return child;
}

// --------------------------------------------------------------------------------------- RouteTrie

const RouteNode* RouteTrie::find_node_(std::string_view path) const {
  if (path.empty())
    return &root_;
  const RouteNode* node = &root_;
  for (const auto segment : explode(path, k_delimiter)) {
    node = node->find_child(segment);
    if (node == nullptr)
      return nullptr;
  }
  return node;
}

std::error_code RouteTrie::insert(std::string_view path, RpcHandlerPtr handler) {
  if (path.empty() || handler == nullptr)
    return make_error_code(ecode::argument_error);

  RouteNode* node = &root_;
  for (const auto segment : explode(path, k_delimiter))
    node = &node->get_or_create_child_(segment);
  node->bind_handler(std::move(handler));
  return {};
}

tl::expected<RpcHandlerPtr, std::error_code> RouteTrie::lookup(std::string_view path) const {
  const auto* node = find_node_(path);
  if (node == nullptr)
    return tl::make_unexpected(make_error_code(ecode::no_such_route));
  return node->handler();
}

bool RouteTrie::remove(std::string_view path) {
  if (path.empty())
    return false;

  const auto segments = explode(path, k_delimiter);
  RouteNode* parent = &root_;
  for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
    parent = parent->find_child_(segments[i]);
    if (parent == nullptr)
      return false;
  }
  return parent->detach_child_(segments.back()) != nullptr;
}

} // namespace junction::net
