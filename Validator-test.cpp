#include "Validator.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

#include <unistd.h>

#include <fmt/format.h>

#include <glog/logging.h>

namespace fs = std::filesystem;

using namespace std::chrono_literals;

namespace {
// Domains starting with "nx" have no mail exchangers.
class Fake_resolver : public MX_resolver {
public:
  Resolution lookup(std::string const&        domain,
                    std::chrono::milliseconds timeout,
                    std::stop_token           stop) override
  {
    ++calls;
    if (domain.starts_with("nx")) {
      return Resolution{false, Error{Error_kind::dns_lookup_failure, domain,
                                     "no MX records"}};
    }
    return Resolution{true, {}};
  }

  std::atomic<int> calls{0};
};

class Stuck_resolver : public MX_resolver {
public:
  Resolution lookup(std::string const&        domain,
                    std::chrono::milliseconds timeout,
                    std::stop_token           stop) override
  {
    for (auto i = 0; (i < 500) && !stop.stop_requested(); ++i)
      std::this_thread::sleep_for(10ms);
    return Resolution{true, {}};
  }
};

// Out of threads, say.
class Failing_resolver : public MX_resolver {
public:
  Resolution lookup(std::string const&        domain,
                    std::chrono::milliseconds timeout,
                    std::stop_token           stop) override
  {
    throw std::system_error(
        std::make_error_code(std::errc::resource_unavailable_try_again),
        "can't start lookup");
  }
};

std::string write_list(std::string_view name, std::string_view json)
{
  auto const path = fs::temp_directory_path() /
                    fmt::format("validator-test-{}-{}", getpid(), name);
  std::ofstream ofs(path, std::ios::out | std::ios::trunc);
  ofs << json;
  ofs.close();
  CHECK(ofs) << "can't write " << path;
  return "file://" + path.string();
}

Options offline()
{
  Options opts;
  opts.check_dns         = false;
  opts.min_domain_length = 3;
  return opts;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const resolver = std::make_shared<Fake_resolver>();

  {
    Validator v(offline(), resolver);
    CHECK_EQ(v.options().max_email_length, 254);
    CHECK_EQ(v.options().min_domain_length, 3);
    CHECK_EQ(v.free_provider_count(), 5);

    auto r = v.validate("user@example.com");
    CHECK(r.is_valid) << r;
    CHECK(!r.error);
    CHECK_EQ(r.original, "user@example.com");
    CHECK_EQ(r.address, "user@example.com");
    CHECK(r.name.empty());
    CHECK(r.is_reserved); // flagged, not rejected
    CHECK_GE(r.validation_time.count(), 0);

    r = v.validate(R"("John Doe" <john.doe@example.com>)");
    CHECK(r.is_valid) << r;
    CHECK_EQ(r.name, "John Doe");
    CHECK_EQ(r.address, "john.doe@example.com");

    for (auto const bad : {"invalid.email", "user@host@domain.com", "invalid@",
                           "@example.com", ""}) {
      r = v.validate(bad);
      CHECK(!r.is_valid) << bad;
      CHECK(r.error) << bad;
      CHECK_EQ(r.error->kind, Error_kind::parse_failure) << bad;
      CHECK_EQ(r.original, bad);
    }

    r = v.validate("user@ex");
    CHECK(!r.is_valid);
    CHECK_EQ(r.error->kind, Error_kind::domain_too_short);
    CHECK_EQ(r.address, "user@ex");

    auto const long_email = std::string(290, 'a') + "@example.com";
    r                     = v.validate(long_email);
    CHECK(!r.is_valid);
    CHECK_EQ(r.error->kind, Error_kind::length_exceeded);
    CHECK(r.address.empty());

    // Checks that are off leave their flags alone.
    r = v.validate("user@gmail.com");
    CHECK(r.is_valid);
    CHECK(!r.is_free_provider);
    CHECK(!r.is_disposable);
    CHECK_EQ(resolver->calls.load(), 0);
  }

  {
    auto opts              = offline();
    opts.reject_ip_domains = true;
    Validator v(opts, resolver);

    auto r = v.validate("user@[127.0.0.1]");
    CHECK(!r.is_valid);
    CHECK(r.is_ip_domain);
    CHECK_EQ(r.error->kind, Error_kind::ip_domain_rejected);
    CHECK_EQ(r.error->context, "[127.0.0.1]");

    r = v.validate("user@[::1]");
    CHECK(!r.is_valid);
    CHECK(r.is_ip_domain);

    r = v.validate("user@[IPv6:2001:db8::1]");
    CHECK(!r.is_valid);
    CHECK(r.is_ip_domain);

    // The tag may front an IPv4 address.
    r = v.validate("user@[IPv6:192.0.2.1]");
    CHECK(!r.is_valid);
    CHECK(r.is_ip_domain);
    CHECK_EQ(r.error->kind, Error_kind::ip_domain_rejected);
    CHECK_EQ(r.error->context, "[IPv6:192.0.2.1]");

    opts.reject_ip_domains = false;
    Validator lenient(opts, resolver);
    r = lenient.validate("user@[127.0.0.1]");
    CHECK(r.is_valid) << r;
    CHECK(r.is_ip_domain);

    // Not a literal, just an odd name.
    r = lenient.validate("user@127.0.0.1");
    CHECK(!r.is_ip_domain);
  }

  {
    auto opts            = offline();
    opts.reject_reserved = true;
    Validator v(opts, resolver);

    struct {
      char const* email;
      bool        reserved;
    } const cases[]{
        {"user@example.com", true},     {"user@mydomain.example", true},
        {"user@domain.test", true},     {"user@test", false},
        {"user@mytest.com", false},     {"user@gmail.com", false},
        {"user@localhost", true},       {"user@foo.localhost", true},
        {"user@localhost.foo.com", false}, {"user@EXAMPLE.COM", true},
    };
    for (auto const& c : cases) {
      auto const r = v.validate(c.email);
      if (std::string_view(c.email) == "user@test") {
        // Too short for min_domain_length 3 is checked first.
        continue;
      }
      CHECK_EQ(r.is_reserved, c.reserved) << c.email;
      CHECK_EQ(r.is_valid, !c.reserved) << c.email;
      if (c.reserved)
        CHECK_EQ(r.error->kind, Error_kind::reserved_domain_rejected);
    }

    auto lax              = offline();
    lax.min_domain_length = 1;
    lax.reject_reserved   = true;
    Validator tiny(lax, resolver);
    auto const r = tiny.validate("user@test");
    CHECK(r.is_reserved);
    CHECK_EQ(r.error->kind, Error_kind::reserved_domain_rejected);
  }

  {
    auto opts                = offline();
    opts.reject_named_emails = true;
    Validator v(opts, resolver);

    auto r = v.validate("John <john@company.com>");
    CHECK(!r.is_valid);
    CHECK_EQ(r.error->kind, Error_kind::named_address_not_allowed);
    CHECK_EQ(r.name, "John");

    r = v.validate("john@company.com");
    CHECK(r.is_valid) << r;
  }

  {
    auto opts                = offline();
    opts.check_free_provider = true;
    Validator v(opts, resolver);

    auto r = v.validate("user@gmail.com");
    CHECK(r.is_valid);
    CHECK(r.is_free_provider);

    r = v.validate("user@GMail.COM");
    CHECK(r.is_free_provider);

    r = v.validate("user@company.com");
    CHECK(!r.is_free_provider);

    v.register_free_providers({"Company.com"});
    CHECK_EQ(v.free_provider_count(), 6);
    r = v.validate("user@company.com");
    CHECK(r.is_free_provider);
    CHECK(r.is_valid);
  }

  auto const disposable_uri =
      write_list("disposable.json", R"(["mailinator.com", "yopmail.com"])");
  auto const free_uri = write_list("free.json", R"(["freemail.com"])");
  auto const bloom_uri =
      write_list("bloom.json", R"(["guerrillamail.com", "sharklasers.com"])");

  {
    auto opts                 = offline();
    opts.check_disposable     = true;
    opts.check_free_provider  = true;
    opts.reject_disposable    = true;
    opts.reject_free_provider = true;
    opts.disposable_list_url  = disposable_uri;
    opts.free_providers_url   = free_uri;

    std::optional<Error> err;
    auto const           v = Validator::create(opts, err, resolver);
    CHECK(v) << *err;
    CHECK(!err);
    CHECK_EQ(v->disposable_count(), 2);
    CHECK_EQ(v->free_provider_count(), 6);

    auto r = v->validate("user@mailinator.com");
    CHECK(!r.is_valid);
    CHECK(r.is_disposable);
    CHECK_EQ(r.error->kind, Error_kind::disposable_domain_rejected);
    CHECK_EQ(r.error->context, "mailinator.com");

    r = v->validate("user@freemail.com");
    CHECK(!r.is_valid);
    CHECK(r.is_free_provider);
    CHECK_EQ(r.error->kind, Error_kind::free_provider_rejected);

    r = v->validate("user@gmail.com");
    CHECK_EQ(r.error->kind, Error_kind::free_provider_rejected);

    r = v->validate("user@company.com");
    CHECK(r.is_valid) << r;

    v->register_disposable_domains({"Temp-Mail.ORG"});
    r = v->validate("user@temp-mail.org");
    CHECK(r.is_disposable);

    // Empty URI, nothing to do.
    CHECK(!v->load_disposable_domains(""));
    CHECK(!v->load_free_providers(""));

    auto const missing = "file:///no/such/dir/list.json";
    err                = v->load_disposable_domains(missing);
    CHECK(err);
    CHECK_EQ(err->kind, Error_kind::list_load_failure);
    CHECK_EQ(err->context, missing);
    CHECK_EQ(v->disposable_count(), 3);

    // Exact sets can't be saved.
    std::stringstream blob;
    err = v->save_bloom_filter(blob);
    CHECK(err);
    CHECK_EQ(err->kind, Error_kind::filter_not_initialized);

    err = v->use_bloom_filter(missing, Bloom_options{});
    CHECK(err);
    CHECK_EQ(err->kind, Error_kind::list_load_failure);
    CHECK_EQ(v->membership_mode(), Membership_mode::exact);

    Bloom_options bopts;
    bopts.trusted_domains       = {"YopMail.com"};
    bopts.verification_attempts = 2;
    err                         = v->use_bloom_filter(bloom_uri, bopts);
    CHECK(!err) << *err;
    CHECK_EQ(v->membership_mode(), Membership_mode::bloom);

    for (auto const dom : {"guerrillamail.com", "sharklasers.com",
                           "mailinator.com", "temp-mail.org"}) {
      r = v->validate(fmt::format("user@{}", dom));
      CHECK(r.is_disposable) << dom;
      CHECK_EQ(r.error->kind, Error_kind::disposable_domain_rejected);
    }
    r = v->validate("user@yopmail.com");
    CHECK(!r.is_disposable);
    CHECK(r.is_valid) << r;

    v->register_disposable_domains({"throwaway.email"});
    r = v->validate("user@throwaway.email");
    CHECK(r.is_disposable);

    CHECK(!v->save_bloom_filter(blob));

    // A fresh validator picks up the saved filter.
    auto other_opts             = offline();
    other_opts.check_disposable = true;
    Validator other(other_opts, resolver);
    CHECK(!other.load_bloom_filter(blob));
    CHECK_EQ(other.membership_mode(), Membership_mode::bloom);
    for (auto const dom : {"guerrillamail.com", "mailinator.com",
                           "temp-mail.org", "throwaway.email"}) {
      r = other.validate(fmt::format("user@{}", dom));
      CHECK(r.is_disposable) << dom;
    }

    std::stringstream junk("junk");
    err = other.load_bloom_filter(junk);
    CHECK(err);
    CHECK_EQ(err->kind, Error_kind::filter_deserialize_failure);
    CHECK(other.validate("user@mailinator.com").is_disposable);
  }

  {
    // Initial list loads only when the check is on.
    auto opts                = offline();
    opts.disposable_list_url = "file:///no/such/dir/list.json";

    std::optional<Error> err;
    CHECK(Validator::create(opts, err, resolver));
    CHECK(!err);

    opts.check_disposable = true;
    CHECK(!Validator::create(opts, err, resolver));
    CHECK(err);
    CHECK_EQ(err->kind, Error_kind::list_load_failure);
  }

  {
    auto opts      = offline();
    opts.check_dns = true;
    Validator v(opts, resolver);

    auto const before = resolver->calls.load();

    auto r = v.validate("user@company.com");
    CHECK(r.is_valid) << r;
    r = v.validate("other@Company.com");
    CHECK(r.is_valid) << r;
    CHECK_EQ(resolver->calls.load(), before + 1);

    r = v.validate("user@nx-company.com");
    CHECK(!r.is_valid);
    CHECK_EQ(r.error->kind, Error_kind::dns_lookup_failure);
    CHECK_EQ(v.dns_cache_size(), 2);

    opts.dns_timeout = 50ms;
    Validator  stuck(opts, std::make_shared<Stuck_resolver>());
    auto const slow = stuck.validate("user@slow.com");
    CHECK(!slow.is_valid);
    CHECK_EQ(slow.error->kind, Error_kind::dns_timeout);
    CHECK(slow.validation_time < 5s);

    // A failure after parsing is a DNS failure, not a syntax error.
    Validator  failing(opts, std::make_shared<Failing_resolver>());
    auto const broke = failing.validate("Jane <jane@company.com>");
    CHECK(!broke.is_valid);
    CHECK_EQ(broke.address, "jane@company.com");
    CHECK_EQ(broke.name, "Jane");
    CHECK(broke.error);
    CHECK_EQ(broke.error->kind, Error_kind::dns_lookup_failure);
    CHECK_EQ(broke.error->context, "company.com");
    CHECK(broke.error->detail.find("can't start lookup") != std::string::npos)
        << broke.error->detail;
  }

  {
    // Validating while registering.
    auto opts             = offline();
    opts.check_dns        = true;
    opts.check_disposable = true;
    opts.dns_cache_size   = 16;
    Validator v(opts, resolver);

    std::vector<std::thread> threads;
    for (auto t = 0; t < 4; ++t) {
      threads.emplace_back([&v, t] {
        for (auto i = 0; i < 250; ++i)
          v.register_disposable_domains({fmt::format("spam{}-{}.com", t, i)});
      });
    }
    std::atomic<int> valid{0};
    for (auto t = 0; t < 8; ++t) {
      threads.emplace_back([&v, &valid, t] {
        for (auto i = 0; i < 250; ++i) {
          auto const r = v.validate(fmt::format("u{}@host{}.com", t, i % 40));
          if (r.is_valid)
            ++valid;
        }
      });
    }
    for (auto& thread : threads)
      thread.join();

    CHECK_EQ(valid.load(), 8 * 250);
    CHECK_EQ(v.disposable_count(), 4 * 250);
    CHECK_LE(v.dns_cache_size(), 16);
    for (auto t = 0; t < 4; ++t) {
      for (auto i = 0; i < 250; ++i) {
        auto const r = v.validate(fmt::format("x@spam{}-{}.com", t, i));
        CHECK(r.is_disposable);
      }
    }
  }

  for (auto const& uri : {disposable_uri, free_uri, bloom_uri})
    fs::remove(uri.substr(std::string_view("file://").size()));
}
