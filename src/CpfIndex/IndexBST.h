#pragma once

#include <cstddef>
#include <queue>
#include <utility>
#include <vector>

#include "src/CpfIndex/IndexNode.h"

namespace CpfIndex {
enum class TraversalOrder {
  PRE,      // Node, left, right
  IN,       // Left, node, right (ascending keys)
  POST,     // Left, right, node
  BREADTH,  // Level by level, left to right
};

// Unbalanced BST mapping record keys to positions in an external record list.
// Height follows insertion order; sequential keys degrade it to a list.
template <class R>
struct IndexBST {
  using Key = typename R::key_type;
  using Node = IndexNode<R>;

  IndexBST() = default;

  // Indexes every record of the sequence at its offset in that sequence
  template <class Sequence>
  explicit IndexBST(const Sequence& records) {
    std::size_t position = 0;
    for (const R& record : records)
      insert(record, position++);
  }

  IndexBST(const IndexBST& other) : root(cloneSubtree(other.root)) {}

  IndexBST(IndexBST&& other) noexcept
      : root(std::exchange(other.root, nullptr)) {}

  IndexBST& operator=(IndexBST other) noexcept {
    std::swap(root, other.root);
    return *this;
  }

  ~IndexBST() { clear(); }

  bool operator[](const Key& key) const { return search(key) != nullptr; }

  bool empty() const { return root == nullptr; }

  void insert(const R& record, std::size_t position) {
    Node** curPtr = &root;

    while (*curPtr != nullptr) {
      Node* cur = *curPtr;
      if (record.key() < cur->key())
        curPtr = &cur->left;
      else if (cur->key() < record.key())
        curPtr = &cur->right;
      else
        return;  // Duplicate key, first insertion wins
    }

    *curPtr = new Node(record, position);
  }

  const Node* search(const Key& key) const {
    const Node* cur = root;

    while (cur != nullptr) {
      if (key == cur->key())
        return cur;
      else if (key < cur->key())
        cur = cur->left;
      else
        cur = cur->right;
    }
    return nullptr;
  }

  Node* search(const Key& key) {
    return const_cast<Node*>(std::as_const(*this).search(key));
  }

  void remove(const Key& key) {
    Node **curPtr = &root, *cur = root;

    while (cur != nullptr && cur->key() != key) {
      if (key < cur->key()) {
        curPtr = &cur->left;
        cur = cur->left;
      } else {
        curPtr = &cur->right;
        cur = cur->right;
      }
    }

    if (cur == nullptr)
      return;

    if (cur->left == nullptr) {
      *curPtr = cur->right;
      delete cur;
      return;
    } else if (cur->right == nullptr) {
      *curPtr = cur->left;
      delete cur;
      return;
    }

    // Two children: promote the payload of the leftmost node of the right
    // subtree, then unlink that node. It has no left child.
    Node** successorPtr = &(cur->right);
    Node* successor = cur->right;
    while (successor->left != nullptr) {
      successorPtr = &(successor->left);
      successor = successor->left;
    }

    cur->record = std::move(successor->record);
    cur->position = successor->position;
    *successorPtr = successor->right;
    delete successor;
  }

  IndexBST copy() const { return IndexBST{*this}; }

  void clear() {
    cleanup(root);
    root = nullptr;
  }

  std::vector<R> traverse(TraversalOrder order) const {
    std::vector<R> records;
    visit(order, [&records](const Node& node) {
      records.push_back(node.record);
    });
    return records;
  }

  template <class Visitor>
  void visit(TraversalOrder order, Visitor&& visitor) const {
    switch (order) {
      case TraversalOrder::PRE:
        preOrder(root, visitor);
        break;
      case TraversalOrder::IN:
        inOrder(root, visitor);
        break;
      case TraversalOrder::POST:
        postOrder(root, visitor);
        break;
      case TraversalOrder::BREADTH:
        levelOrder(root, visitor);
        break;
    }
  }

 private:
  Node* root = nullptr;

  static Node* cloneSubtree(const Node* node) {
    if (node == nullptr)
      return nullptr;

    Node* clone = new Node(node->record, node->position);
    try {
      clone->left = cloneSubtree(node->left);
      clone->right = cloneSubtree(node->right);
    } catch (...) {
      cleanup(clone);
      throw;
    }
    return clone;
  }

  static void cleanup(Node* node) {
    if (node == nullptr)
      return;
    cleanup(node->left);
    cleanup(node->right);

    delete node;
  }

  template <class Visitor>
  static void preOrder(const Node* node, Visitor& visitor) {
    if (node == nullptr)
      return;
    visitor(*node);
    preOrder(node->left, visitor);
    preOrder(node->right, visitor);
  }

  template <class Visitor>
  static void inOrder(const Node* node, Visitor& visitor) {
    if (node == nullptr)
      return;
    inOrder(node->left, visitor);
    visitor(*node);
    inOrder(node->right, visitor);
  }

  template <class Visitor>
  static void postOrder(const Node* node, Visitor& visitor) {
    if (node == nullptr)
      return;
    postOrder(node->left, visitor);
    postOrder(node->right, visitor);
    visitor(*node);
  }

  template <class Visitor>
  static void levelOrder(const Node* node, Visitor& visitor) {
    if (node == nullptr)
      return;

    std::queue<const Node*> pending;
    pending.push(node);
    while (!pending.empty()) {
      const Node* cur = pending.front();
      pending.pop();
      visitor(*cur);
      if (cur->left != nullptr)
        pending.push(cur->left);
      if (cur->right != nullptr)
        pending.push(cur->right);
    }
  }
};
}  // namespace CpfIndex
