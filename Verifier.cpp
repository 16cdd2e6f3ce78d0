#include "Verifier.hpp"

#include "Errors.hpp"
#include "HTTP.hpp"
#include "Provider.hpp"
#include "TLD.hpp"

#include <exception>
#include <future>

#include <glog/logging.h>

namespace {
std::unique_ptr<Provider>
make_provider(Config::Source const&                 source,
              std::shared_ptr<HTTP::Fetcher> const& fetcher)
{
  if (!source.file.empty())
    return std::make_unique<FileProvider>(source.file);
  return std::make_unique<URLProvider>(source.url, fetcher);
}

Dataset::entry_set make_entry_set(std::vector<std::string> const& lines)
{
  if (lines.empty())
    return {};
  auto const entries = FixedProvider{lines}.provide();
  return Dataset::entry_set(begin(entries), end(entries));
}

std::unique_ptr<Check::DatasetChecker>
make_list_checker(char const*                           name,
                  Dataset::key_type                     type,
                  Config::List_settings const&          list,
                  std::shared_ptr<HTTP::Fetcher> const& fetcher)
{
  if (!list.enabled)
    return {};
  auto matcher = std::make_unique<Dataset::Matcher>(
      type, make_provider(list.source, fetcher), make_entry_set(list.allow),
      make_entry_set(list.deny));
  return std::make_unique<Check::DatasetChecker>(name, type,
                                                 std::move(matcher));
}

// Skip a disabled or inapplicable check, otherwise run it and let the
// predicate decide between Passed and Failed.  Exceptions become
// Errored.
template <typename Output, typename Context, typename Predicate>
Check::Result<Output> run_check(Check::Checker<Output, Context>* checker,
                                bool                             applicable,
                                Mailbox const&                   mbx,
                                Context const&                   ctx,
                                Predicate                        passed)
{
  if (!checker || !applicable)
    return Check::Skipped{};

  try {
    auto data = checker->check(mbx, ctx);
    VLOG(1) << checker->name() << ": " << data;
    if (passed(data))
      return Check::Passed<Output>{std::move(data)};
    return Check::Failed<Output>{std::move(data)};
  }
  catch (std::exception const& e) {
    LOG(WARNING) << checker->name() << " check for " << mbx
                 << " errored: " << e.what();
    return Check::Errored{std::current_exception(), e.what()};
  }
}

bool not_listed(Dataset::Data const& data) { return !data.match; }

void refresh_one(Check::Refreshable* checker,
                 char const*         name,
                 std::exception_ptr& first_error)
{
  if (!checker)
    return;
  try {
    checker->refresh();
    LOG(INFO) << name << " refreshed";
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "refresh of " << name << " failed: " << e.what();
    if (!first_error)
      first_error = std::current_exception();
  }
}
} // namespace

bool Validation_result::likely_deliverable() const
{
  return !(Check::is_failed(syntax) || Check::is_failed(registrability)
           || Check::is_failed(mx) || Check::is_failed(disposable));
}

std::ostream& operator<<(std::ostream& os, Validation_result const& res)
{
  // clang-format off
  os << res.email << '\n'
     << "  parts:              username=«" << res.parts.username()
                               << "» plus_tag=«" << res.parts.plus_tag()
                               << "» hostname=«" << res.parts.hostname() << "»\n"
     << "  syntax:             " << res.syntax << '\n'
     << "  registrability:     " << res.registrability << '\n'
     << "  mx:                 " << res.mx << '\n'
     << "  disposable:         " << res.disposable << '\n'
     << "  avatar:             " << res.avatar << '\n'
     << "  free:               " << res.free << '\n'
     << "  role_based:         " << res.role_based << '\n'
     << "  smtp:               " << res.smtp << '\n'
     << "  likely_deliverable: " << std::boolalpha << res.likely_deliverable()
                                 << std::noboolalpha << '\n';
  // clang-format on
  return os;
}

Verifier::Verifier(Checkers checkers)
  : checkers_(std::move(checkers))
{
  if (!checkers_.syntax)
    checkers_.syntax = std::make_unique<Check::SyntaxChecker>();
}

Verifier Verifier::create(Config::Settings                  settings,
                          std::shared_ptr<HTTP::Fetcher>    fetcher,
                          std::shared_ptr<DNS::MX_resolver> resolver,
                          SMTP::Connector                   connector)
{
  Config::validate(settings);

  if (!fetcher)
    fetcher = std::make_shared<HTTP::Client>(settings.http_timeout);

  Checkers checkers;
  checkers.syntax = std::make_unique<Check::SyntaxChecker>();

  if (settings.registrability.enabled) {
    auto tld = std::make_unique<TLD>(
        make_provider(settings.registrability.source, fetcher),
        settings.registrability.custom_rules);
    checkers.registrability
        = std::make_unique<Check::RegistrabilityChecker>(std::move(tld));
  }

  checkers.disposable = make_list_checker(
      "disposable", Dataset::key_type::hostname, settings.disposable, fetcher);
  checkers.free = make_list_checker("free", Dataset::key_type::hostname,
                                    settings.free, fetcher);
  checkers.role_based = make_list_checker(
      "role_based", Dataset::key_type::exact, settings.role_based, fetcher);

  if (settings.mx.enabled) {
    if (!resolver) {
      resolver = std::make_shared<DNS::DoH_resolver>(
          fetcher, settings.mx.doh_endpoint);
    }
    checkers.mx = std::make_unique<Check::MXChecker>(resolver);
  }

  if (settings.avatar.enabled) {
    checkers.avatar = std::make_unique<Check::AvatarChecker>(
        std::make_unique<Avatar>(fetcher, settings.avatar.endpoint));
  }

  if (settings.smtp.enabled) {
    auto const& smtp = settings.smtp;
    if (!connector) {
      if (smtp.proxy_host.empty()) {
        connector = SMTP::tcp_connect;
      }
      else {
        LOG(INFO) << "SMTP probe through SOCKS5 proxy " << smtp.proxy_host
                  << ':' << smtp.proxy_port;
        connector = SMTP::socks5_connector(smtp.proxy_host, smtp.proxy_port);
      }
    }

    SMTP::Prober::Options options;
    options.catch_all_check = smtp.catch_all_check;
    options.max_retries     = smtp.max_retries;
    options.timeout         = smtp.timeout;
    options.port            = smtp.port;
    options.helo_domain     = smtp.helo_domain;
    options.sender          = smtp.sender;

    checkers.smtp = std::make_unique<Check::SMTPChecker>(
        std::make_unique<SMTP::Prober>(options, connector));
  }

  return Verifier{std::move(checkers)};
}

Validation_result Verifier::verify(std::string_view email)
{
  Validation_result res;
  res.email = std::string(email);

  Mailbox mbx;
  std::string msg;
  if (!Mailbox::validate(email, msg, mbx)) {
    LOG(INFO) << msg;
    res.syntax = Check::Failed<Syntax::Data>{Syntax::Data{}};
    return res;
  }
  res.parts = mbx;

  Check::Unit const unit;

  res.syntax = run_check(checkers_.syntax.get(), true, mbx, unit,
                         [](Syntax::Data const& d) { return d.all(); });

  auto const* syntax = Check::data(res.syntax);
  CHECK(syntax != nullptr);
  auto const username_ok = syntax->username;
  auto const hostname_ok = syntax->hostname;

  auto launch = [](auto fn) { return std::async(std::launch::async, fn); };

  auto registrability = launch([&] {
    return run_check(checkers_.registrability.get(), hostname_ok, mbx, unit,
                     [](Check::Registrability_data const& d) {
                       return d.registrable_domain.has_value();
                     });
  });
  auto disposable = launch([&] {
    return run_check(checkers_.disposable.get(), hostname_ok, mbx, unit,
                     not_listed);
  });
  auto freemail = launch([&] {
    return run_check(checkers_.free.get(), hostname_ok, mbx, unit, not_listed);
  });
  auto role_based = launch([&] {
    return run_check(checkers_.role_based.get(), username_ok, mbx, unit,
                     not_listed);
  });
  auto avatar = launch([&] {
    return run_check(checkers_.avatar.get(), username_ok && hostname_ok, mbx,
                     unit,
                     [](Avatar::Data const& d) { return d.url.has_value(); });
  });
  auto mx = launch([&] {
    return run_check(
        checkers_.mx.get(), hostname_ok, mbx, unit,
        [](Check::MX_data const& d) { return !d.records.empty(); });
  });

  // SMTP needs the exchangers.
  res.mx = mx.get();

  DNS::RR_MX_collection mxs;
  if (Check::is_passed(res.mx))
    mxs = Check::data(res.mx)->records;
  res.smtp = run_check(
      checkers_.smtp.get(),
      username_ok && hostname_ok && Check::is_passed(res.mx), mbx, mxs,
      [](SMTP::Outcome const& o) { return o.deliverable; });

  res.registrability = registrability.get();
  res.disposable     = disposable.get();
  res.free           = freemail.get();
  res.role_based     = role_based.get();
  res.avatar         = avatar.get();

  return res;
}

void Verifier::refresh()
{
  std::exception_ptr first_error;

  refresh_one(checkers_.registrability.get(), "registrability", first_error);
  refresh_one(checkers_.disposable.get(), "disposable", first_error);
  refresh_one(checkers_.free.get(), "free", first_error);
  refresh_one(checkers_.role_based.get(), "role_based", first_error);

  if (first_error)
    std::rethrow_exception(first_error);
}
