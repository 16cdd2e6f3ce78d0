#ifndef VERIFIER_DOT_HPP
#define VERIFIER_DOT_HPP

#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "Check.hpp"
#include "Checkers.hpp"
#include "Config.hpp"
#include "Mailbox.hpp"

namespace HTTP {
class Fetcher;
}

struct Validation_result {
  std::string email;
  Mailbox     parts;

  Check::Result<Syntax::Data>               syntax{Check::Skipped{}};
  Check::Result<Check::Registrability_data> registrability{Check::Skipped{}};
  Check::Result<Check::MX_data>             mx{Check::Skipped{}};
  Check::Result<Dataset::Data>              disposable{Check::Skipped{}};
  Check::Result<Avatar::Data>               avatar{Check::Skipped{}};
  Check::Result<Dataset::Data>              free{Check::Skipped{}};
  Check::Result<Dataset::Data>              role_based{Check::Skipped{}};
  Check::Result<SMTP::Outcome>              smtp{Check::Skipped{}};

  // False if syntax, registrability, MX or the disposable check
  // Failed; Errored and Skipped checks don't count against it.
  bool likely_deliverable() const;
};

std::ostream& operator<<(std::ostream& os, Validation_result const& res);

// Runs the checks over one address at a time.  The checks that don't
// depend on each other run concurrently; SMTP waits for MX.

class Verifier {
public:
  // A null checker is a disabled check.
  struct Checkers {
    std::unique_ptr<Check::SyntaxChecker>         syntax;
    std::unique_ptr<Check::RegistrabilityChecker> registrability;
    std::unique_ptr<Check::MXChecker>             mx;
    std::unique_ptr<Check::DatasetChecker>        disposable;
    std::unique_ptr<Check::AvatarChecker>         avatar;
    std::unique_ptr<Check::DatasetChecker>        free;
    std::unique_ptr<Check::DatasetChecker>        role_based;
    std::unique_ptr<Check::SMTPChecker>           smtp;
  };

  Verifier(Verifier const&) = delete;
  Verifier& operator=(Verifier const&) = delete;
  Verifier(Verifier&&)                 = default;

  explicit Verifier(Checkers checkers);

  // Build every enabled checker from validated settings, loading the
  // datasets.  Collaborators not given are made from the settings.
  // Throws std::invalid_argument for bad settings, ConnectionError if a
  // dataset can't be loaded.
  static Verifier create(Config::Settings                  settings,
                         std::shared_ptr<HTTP::Fetcher>    fetcher  = {},
                         std::shared_ptr<DNS::MX_resolver> resolver = {},
                         SMTP::Connector                   connector = {});

  // Never throws for a bad address or a failing collaborator.
  Validation_result verify(std::string_view email);

  // Reload every dataset; each failure is logged and leaves that
  // dataset as it was.  The first failure is rethrown once all have
  // been tried.
  void refresh();

private:
  Checkers checkers_;
};

#endif // VERIFIER_DOT_HPP
