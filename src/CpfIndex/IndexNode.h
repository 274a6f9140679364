#pragma once

#include <cstddef>

namespace CpfIndex {
template <class R>
struct IndexNode {
  R record;
  std::size_t position;  // Offset of the authoritative record in the list
  IndexNode<R>*left, *right;

  explicit IndexNode(const R& record, std::size_t position,
                     IndexNode* left = nullptr, IndexNode* right = nullptr)
      : record(record), position(position), left(left), right(right) {}

  const typename R::key_type& key() const { return record.key(); }
};
}  // namespace CpfIndex
