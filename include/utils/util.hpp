#ifndef S3LOGX_UTIL_HPP
#define S3LOGX_UTIL_HPP

#include "typedef.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// 错误处理函数 (只用于命令行层, 库代码不退出进程)
[[noreturn]] void handle_error(const std::string &message, int exit_code = 1);
bool try_stoul(std::string_view str, uint32_t &value);
bool try_stoull(std::string_view str, uint64_t &value);

// 按空白符切分, 连续空白视为一个分隔符, 结果指向原字符串
void split_whitespace(std::string_view str, VecSV &out);

// 自然排序: 数字段按数值比较 ("2.log" < "10.log")
bool natural_less(const std::string &lhs, const std::string &rhs);

#endif // S3LOGX_UTIL_HPP
