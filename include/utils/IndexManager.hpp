#ifndef S3LOGX_INDEXMANAGER_HPP
#define S3LOGX_INDEXMANAGER_HPP

#include <cstddef>

// 一段连续下标 [base, base + size)
class IndexManager {
private:
  size_t base;
  size_t size;

public:
  IndexManager(size_t base, size_t size) : base(base), size(size) {}
  size_t operator[](const size_t i) const { return base + i; }
  size_t len() const { return size; }
};

#endif // S3LOGX_INDEXMANAGER_HPP
