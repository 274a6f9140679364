#pragma once

#include <string>
#include <vector>

#include "src/CpfIndex/IndexBST.h"
#include "src/CpfIndex/Record.h"

namespace PrivateAccess {
template <auto memberPtr>
struct AccessPrivateVars {
  static constexpr auto kMemPtr = memberPtr;
  struct Delegate;
};
}  // namespace PrivateAccess

#define DEFINE_ACCESSOR(qualified_class_name, class_data_member)                 \
  namespace PrivateAccess {                                                      \
  template <>                                                                    \
  struct AccessPrivateVars<&qualified_class_name::class_data_member>::Delegate { \
    friend auto &get_##class_data_member(qualified_class_name &obj) {            \
      return obj.*kMemPtr;                                                       \
    }                                                                            \
  };                                                                             \
  auto &get_##class_data_member(qualified_class_name &obj);                      \
  }

using Index = CpfIndex::IndexBST<CpfIndex::Record>;
using IndexNode = CpfIndex::IndexNode<CpfIndex::Record>;

// 11-digit, zero padded, so lexicographic order matches numeric order
inline std::string cpfOf(int num) {
  std::string digits = std::to_string(num);
  return std::string(11 - digits.size(), '0') + digits;
}

inline CpfIndex::Record makeRecord(const std::string& cpf) {
  return CpfIndex::Record{cpf, "Person " + cpf, "2000-01-01"};
}

inline std::vector<std::string> keysOf(
    const std::vector<CpfIndex::Record>& records) {
  std::vector<std::string> keys;
  keys.reserve(records.size());
  for (const CpfIndex::Record& record : records)
    keys.push_back(record.cpf);
  return keys;
}

// Every key strictly inside (low, high); nullptr bounds are open
inline bool isOrdered(const IndexNode* node, const std::string* low = nullptr,
                      const std::string* high = nullptr) {
  if (node == nullptr)
    return true;
  if ((low != nullptr && !(*low < node->key())) ||
      (high != nullptr && !(node->key() < *high)))
    return false;
  return isOrdered(node->left, low, &node->key()) &&
         isOrdered(node->right, &node->key(), high);
}

// Insertion order producing a perfectly balanced tree over [start, end]
inline void balancedInsert(Index& tree, int start, int end) {
  if (start > end)
    return;
  int mid = start + (end - start) / 2;
  tree.insert(makeRecord(cpfOf(mid)), mid);

  balancedInsert(tree, start, mid - 1);
  balancedInsert(tree, mid + 1, end);
}
