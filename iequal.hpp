#ifndef IEQUAL_DOT_HPP
#define IEQUAL_DOT_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

// Like boost, but ASCII only.  Only C locale required.

inline bool iequal_char(char a, char b)
{
  return std::tolower(static_cast<unsigned char>(a)) ==
         std::tolower(static_cast<unsigned char>(b));
}

inline bool iequal(std::string_view a, std::string_view b)
{
  return (size(a) == size(b)) &&
         std::equal(begin(b), end(b), begin(a), iequal_char);
}

inline bool istarts_with(std::string_view str, std::string_view prefix)
{
  return (str.size() >= prefix.size()) &&
         iequal(str.substr(0, prefix.size()), prefix);
}

inline bool iends_with(std::string_view str, std::string_view suffix)
{
  return (str.size() >= suffix.size()) &&
         iequal(str.substr(str.size() - suffix.size()), suffix);
}

inline std::string ascii_lower(std::string_view str)
{
  std::string ret(str);
  std::transform(begin(ret), end(ret), begin(ret), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ret;
}

#endif // IEQUAL_DOT_HPP
