#ifndef CHECKERS_DOT_HPP
#define CHECKERS_DOT_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "Avatar.hpp"
#include "Check.hpp"
#include "DNS.hpp"
#include "Dataset.hpp"
#include "Probe.hpp"
#include "Syntax.hpp"

class TLD;

namespace Check {

struct Registrability_data {
  std::optional<std::string> registrable_domain;

  bool operator==(Registrability_data const& rhs) const = default;
};

std::ostream& operator<<(std::ostream& os, Registrability_data const& data);

struct MX_data {
  DNS::RR_MX_collection records;

  bool operator==(MX_data const& rhs) const = default;
};

std::ostream& operator<<(std::ostream& os, MX_data const& data);

class SyntaxChecker : public Checker<Syntax::Data> {
public:
  char const* name() const override { return "syntax"; }
  Syntax::Data check(Mailbox const& mbx, Unit const&) override;
};

class RegistrabilityChecker : public Checker<Registrability_data>,
                              public Refreshable {
public:
  explicit RegistrabilityChecker(std::unique_ptr<TLD> tld);
  ~RegistrabilityChecker() override;

  char const* name() const override { return "registrability"; }
  Registrability_data check(Mailbox const& mbx, Unit const&) override;
  void refresh() override;

private:
  std::unique_ptr<TLD> tld_;
};

// Membership of the host name (disposable, free providers) or the
// username (role accounts) in a list.
class DatasetChecker : public Checker<Dataset::Data>, public Refreshable {
public:
  DatasetChecker(char const*                       name,
                 Dataset::key_type                 type,
                 std::unique_ptr<Dataset::Matcher> matcher);

  char const* name() const override { return name_; }
  Dataset::Data check(Mailbox const& mbx, Unit const&) override;
  void refresh() override;

private:
  char const*                       name_;
  Dataset::key_type                 type_;
  std::unique_ptr<Dataset::Matcher> matcher_;
};

class MXChecker : public Checker<MX_data> {
public:
  explicit MXChecker(std::shared_ptr<DNS::MX_resolver> resolver);

  char const* name() const override { return "mx"; }
  MX_data check(Mailbox const& mbx, Unit const&) override;

private:
  std::shared_ptr<DNS::MX_resolver> resolver_;
};

class SMTPChecker : public Checker<SMTP::Outcome, DNS::RR_MX_collection> {
public:
  explicit SMTPChecker(std::unique_ptr<SMTP::Prober> prober);

  char const* name() const override { return "smtp"; }
  SMTP::Outcome check(Mailbox const&                mbx,
                      DNS::RR_MX_collection const& mxs) override;

private:
  std::unique_ptr<SMTP::Prober> prober_;
};

class AvatarChecker : public Checker<Avatar::Data> {
public:
  explicit AvatarChecker(std::unique_ptr<Avatar> avatar);

  char const* name() const override { return "avatar"; }
  Avatar::Data check(Mailbox const& mbx, Unit const&) override;

private:
  std::unique_ptr<Avatar> avatar_;
};

} // namespace Check

#endif // CHECKERS_DOT_HPP
