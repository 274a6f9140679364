#pragma once

#include <vector>

#include "src/CpfIndex/IndexBST.h"

namespace CpfIndex {
enum class LookupState {
  FOUND,
  DELETED,  // Indexed, but logically deleted in the record list
  NOT_FOUND,
};

template <class R>
struct LookupResult {
  LookupState state;
  const R* record;  // Non-null only when FOUND
};

// The record list must support at(position). Positions are trusted as given
// at insertion time; an out-of-range one surfaces as the list's at() error.
template <class R, class Sequence>
LookupResult<R> lookupByKey(const IndexBST<R>& index, const Sequence& records,
                            const typename R::key_type& key) {
  const IndexNode<R>* node = index.search(key);
  if (node == nullptr)
    return {LookupState::NOT_FOUND, nullptr};

  const R& record = records.at(node->position);
  if (record.deleted)
    return {LookupState::DELETED, nullptr};
  return {LookupState::FOUND, &record};
}

// Copies the list's records in ascending key order, deleted ones included.
template <class R, class Sequence>
std::vector<R> materializeSorted(const IndexBST<R>& index,
                                 const Sequence& records) {
  std::vector<R> sorted;
  index.visit(TraversalOrder::IN, [&](const IndexNode<R>& node) {
    sorted.push_back(records.at(node.position));
  });
  return sorted;
}
}  // namespace CpfIndex
