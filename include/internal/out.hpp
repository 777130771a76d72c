#ifndef S3LOGX_INCLUDE_INTERNAL_OUT_HPP
#define S3LOGX_INCLUDE_INTERNAL_OUT_HPP

#ifdef S3LOGX_ENABLE_DEBUG
#include <cstdio>
#define DEBUG(...)                                                             \
  do {                                                                         \
    std::fprintf(stderr, "DEBUG: ");                                           \
    std::fprintf(stderr, __VA_ARGS__);                                         \
    std::fprintf(stderr, "\n");                                                \
  } while (0);
#else
#define DEBUG(...) void(0);
#endif

#endif // S3LOGX_INCLUDE_INTERNAL_OUT_HPP
