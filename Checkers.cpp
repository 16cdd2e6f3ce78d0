#include "Checkers.hpp"

#include "Mailbox.hpp"
#include "TLD.hpp"

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>

namespace Check {

std::ostream& operator<<(std::ostream& os, Registrability_data const& data)
{
  return os << "registrable_domain="
            << data.registrable_domain.value_or("none");
}

std::ostream& operator<<(std::ostream& os, MX_data const& data)
{
  os << "records=[";
  auto sep = "";
  for (auto const& mx : data.records) {
    os << sep << mx;
    sep = ", ";
  }
  return os << ']';
}

Syntax::Data SyntaxChecker::check(Mailbox const& mbx, Unit const&)
{
  return Syntax::check(mbx);
}

RegistrabilityChecker::RegistrabilityChecker(std::unique_ptr<TLD> tld)
  : tld_(std::move(tld))
{
  CHECK(tld_);
}

RegistrabilityChecker::~RegistrabilityChecker() = default;

Registrability_data RegistrabilityChecker::check(Mailbox const& mbx,
                                                 Unit const&)
{
  return Registrability_data{tld_->get_registered_domain(mbx.hostname())};
}

void RegistrabilityChecker::refresh() { tld_->refresh(); }

DatasetChecker::DatasetChecker(char const*                       name,
                               Dataset::key_type                 type,
                               std::unique_ptr<Dataset::Matcher> matcher)
  : name_(name)
  , type_(type)
  , matcher_(std::move(matcher))
{
  CHECK(matcher_);
}

Dataset::Data DatasetChecker::check(Mailbox const& mbx, Unit const&)
{
  switch (type_) {
  case Dataset::key_type::exact:
    // List entries are lower case.
    return matcher_->check(boost::algorithm::to_lower_copy(mbx.username()));
  case Dataset::key_type::hostname: return matcher_->check(mbx.hostname());
  }
  LOG(FATAL) << "unknown key type";
  return {};
}

void DatasetChecker::refresh() { matcher_->refresh(); }

MXChecker::MXChecker(std::shared_ptr<DNS::MX_resolver> resolver)
  : resolver_(std::move(resolver))
{
  CHECK(resolver_);
}

MX_data MXChecker::check(Mailbox const& mbx, Unit const&)
{
  return MX_data{resolver_->get_mx_records(mbx.hostname())};
}

SMTPChecker::SMTPChecker(std::unique_ptr<SMTP::Prober> prober)
  : prober_(std::move(prober))
{
  CHECK(prober_);
}

SMTP::Outcome SMTPChecker::check(Mailbox const&                mbx,
                                 DNS::RR_MX_collection const& mxs)
{
  return prober_->probe(mbx, mxs);
}

AvatarChecker::AvatarChecker(std::unique_ptr<Avatar> avatar)
  : avatar_(std::move(avatar))
{
  CHECK(avatar_);
}

Avatar::Data AvatarChecker::check(Mailbox const& mbx, Unit const&)
{
  return avatar_->lookup(mbx);
}

} // namespace Check
