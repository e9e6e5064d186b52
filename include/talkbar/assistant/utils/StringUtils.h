#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace talkbar::assistant::utils {

/**
 * @brief 去掉首尾 ASCII 空白，返回副本
 *
 * 按 unsigned char 判断，UTF-8 多字节序列（>= 0x80）原样保留。
 */
inline std::string trimCopy(std::string s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

} // namespace talkbar::assistant::utils
