#include "Domain-list.hpp"

#include "HTTP.hpp"
#include "iequal.hpp"

#include <fstream>
#include <iterator>

#include <fmt/format.h>

#include <glog/logging.h>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

using namespace std::literals::string_view_literals;

namespace domain_list {

bool parse(std::string_view body, std::vector<std::string>& domains,
           std::string& msg)
{
  std::vector<std::string> parsed;

  try {
    auto const list = json::parse(body);
    if (!list.is_array()) {
      msg = fmt::format("expected a JSON array, got {}", list.type_name());
      return false;
    }

    parsed.reserve(list.size());
    for (auto const& entry : list) {
      if (!entry.is_string()) {
        msg = fmt::format("expected a string, got {}", entry.type_name());
        return false;
      }
      auto dom = entry.get<std::string>();
      if (!dom.empty())
        parsed.push_back(std::move(dom));
    }
  }
  catch (json::exception const& e) {
    msg = e.what();
    return false;
  }

  domains.insert(end(domains), std::make_move_iterator(begin(parsed)),
                 std::make_move_iterator(end(parsed)));
  return true;
}

std::optional<Error> fetch(std::string_view uri,
                           std::vector<std::string>& domains)
{
  auto const fail = [uri](std::string detail) {
    LOG(WARNING) << "can't load domain list «" << uri << "»: " << detail;
    return Error{Error_kind::list_load_failure, std::string(uri),
                 std::move(detail)};
  };

  std::string body;
  std::string msg;

  constexpr auto file_pfx{"file://"sv};

  if (istarts_with(uri, file_pfx)) {
    auto const    path = std::string(uri.substr(file_pfx.size()));
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs)
      return fail(fmt::format("can't open «{}»", path));
    body.assign(std::istreambuf_iterator<char>{ifs}, {});
    if (ifs.bad())
      return fail(fmt::format("error reading «{}»", path));
  }
  else if (istarts_with(uri, "http://"sv) || istarts_with(uri, "https://"sv)) {
    if (!HTTP::get(uri, body, msg))
      return fail(msg);
  }
  else {
    return fail("unsupported URI scheme");
  }

  auto const count = domains.size();
  if (!parse(body, domains, msg))
    return fail(msg);

  LOG(INFO) << "loaded " << (domains.size() - count) << " domains from «"
            << uri << "»";

  return {};
}

} // namespace domain_list
