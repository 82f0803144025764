#ifndef DOMAIN_LIST_DOT_HPP
#define DOMAIN_LIST_DOT_HPP

#include "Error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Domain lists are published as a JSON array of strings:
//
//   ["0-mail.com", "027168.com", ...]

namespace domain_list {

// Parse a JSON array of strings into domains, empty strings skipped.  On
// failure domains is unchanged and msg says why.
bool parse(std::string_view body, std::vector<std::string>& domains,
           std::string& msg);

// Read a list from a file:// or http(s):// URI and append its entries to
// domains.  Any failure is a list_load_failure, and domains is unchanged.
std::optional<Error> fetch(std::string_view uri,
                           std::vector<std::string>& domains);

} // namespace domain_list

#endif // DOMAIN_LIST_DOT_HPP
