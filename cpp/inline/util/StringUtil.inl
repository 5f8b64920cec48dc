#include "util/StringUtil.hpp"

#include <algorithm>
#include <cctype>

namespace util {

inline std::vector<std::string> split(std::string_view s) {
  auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

  std::vector<std::string> tokens;
  auto it = s.begin();
  while (true) {
    it = std::find_if_not(it, s.end(), is_space);
    if (it == s.end()) break;
    auto end = std::find_if(it, s.end(), is_space);
    tokens.emplace_back(it, end);
    it = end;
  }
  return tokens;
}

inline std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

inline std::string grammatically_join(const std::vector<std::string>& items,
                                      const std::string& conjunction, bool oxford_comma) {
  std::string result;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      bool last = i + 1 == items.size();
      if (!last) {
        result += ", ";
      } else if (items.size() == 2 || !oxford_comma) {
        result += " " + conjunction + " ";
      } else {
        result += ", " + conjunction + " ";
      }
    }
    result += items[i];
  }
  return result;
}

}  // namespace util
