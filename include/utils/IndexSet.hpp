#ifndef S3LOGX_INDEX_SET_HPP
#define S3LOGX_INDEX_SET_HPP

#include "absl/container/flat_hash_set.h"
#include <cstddef>
#include <vector>

// 保持插入顺序的去重集合
template <class T> class IndexSet {
private:
  absl::flat_hash_set<T> index_set;
  std::vector<T> data;

public:
  IndexSet() = default;
  bool insert(const T &value) {
    if (!index_set.insert(value).second)
      return false;
    data.emplace_back(value);
    return true;
  }

  bool contains(const T &value) const { return index_set.contains(value); }
  size_t size() const { return data.size(); }
};

#endif // S3LOGX_INDEX_SET_HPP
