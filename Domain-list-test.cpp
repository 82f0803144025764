#include "Domain-list.hpp"

#include <filesystem>
#include <fstream>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace fs = std::filesystem;

namespace {
fs::path write_temp(std::string_view name, std::string_view contents)
{
  auto const path = fs::temp_directory_path() /
                    fmt::format("domain-list-test-{}-{}", getpid(), name);
  std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
  ofs << contents;
  ofs.close();
  CHECK(ofs) << "can't write " << path;
  return path;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  std::string              msg;
  std::vector<std::string> domains;

  CHECK(domain_list::parse(R"(["a.com", "b.com"])", domains, msg));
  CHECK_EQ(domains.size(), 2);
  CHECK_EQ(domains[0], "a.com");
  CHECK_EQ(domains[1], "b.com");

  domains.clear();
  CHECK(domain_list::parse("[]", domains, msg));
  CHECK(domain_list::parse(" [ ] \n", domains, msg));
  CHECK(domains.empty());

  CHECK(domain_list::parse("\n[\n  \"x.com\",\n  \"\"\n]\n", domains, msg));
  CHECK_EQ(domains.size(), 1);
  CHECK_EQ(domains[0], "x.com");

  domains.clear();
  CHECK(domain_list::parse(R"(["caf\u00e9.fr", "a\/b", "\ud83d\udca9.la"])",
                           domains, msg));
  CHECK_EQ(domains.size(), 3);
  CHECK_EQ(domains[0], "caf\xC3\xA9.fr");
  CHECK_EQ(domains[1], "a/b");
  CHECK_EQ(domains[2], "\xF0\x9F\x92\xA9.la");

  domains.clear();
  CHECK(domain_list::parse(R"(["tab\there", "q\"uote"])", domains, msg));
  CHECK_EQ(domains[0], "tab\there");
  CHECK_EQ(domains[1], "q\"uote");

  // Failures leave the output alone.
  domains = {"keep.com"};
  for (auto const bad : {"", "\"a.com\"", R"({"a": "b"})", R"(["a", 1])",
                         R"(["a",])", R"(["a")", R"(["a"] x)", R"([null])",
                         R"(["bad \x escape"])", "[\"ctl\x01\"]",
                         R"(["\ud83d alone"])", "[\"\xC3(\"]"}) {
    CHECK(!domain_list::parse(bad, domains, msg)) << bad;
    CHECK(!msg.empty());
    CHECK_EQ(domains.size(), 1) << bad;
  }

  CHECK(!domain_list::parse(R"({"domains": ["a.com"]})", domains, msg));
  CHECK_EQ(msg, "expected a JSON array, got object");
  CHECK(!domain_list::parse(R"(["a.com", true])", domains, msg));
  CHECK_EQ(msg, "expected a string, got boolean");

  // Appends to what is already there.
  CHECK(domain_list::parse(R"(["new.com"])", domains, msg));
  CHECK_EQ(domains.size(), 2);
  CHECK_EQ(domains[1], "new.com");

  auto const good =
      write_temp("good.json", R"(["mailinator.com", "10minutemail.com"])");
  auto const bad  = write_temp("bad.json", R"(["mailinator.com", )");

  domains.clear();
  auto err = domain_list::fetch("file://" + good.string(), domains);
  CHECK(!err) << *err;
  CHECK_EQ(domains.size(), 2);
  CHECK_EQ(domains[1], "10minutemail.com");

  auto const bad_uri = "file://" + bad.string();
  err                = domain_list::fetch(bad_uri, domains);
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::list_load_failure);
  CHECK_EQ(err->context, bad_uri);
  CHECK_EQ(domains.size(), 2);

  err = domain_list::fetch("file:///no/such/dir/domains.json", domains);
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::list_load_failure);
  CHECK_EQ(domains.size(), 2);

  err = domain_list::fetch("ftp://example.com/domains.json", domains);
  CHECK(err);
  CHECK_EQ(err->kind, Error_kind::list_load_failure);

  err = domain_list::fetch("domains.json", domains);
  CHECK(err);

  fs::remove(good);
  fs::remove(bad);
}
