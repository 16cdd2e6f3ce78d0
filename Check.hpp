#ifndef CHECK_DOT_HPP
#define CHECK_DOT_HPP

#include <exception>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

class Mailbox;

namespace Check {

// The outcome of one check: exactly one of these is active.

template <typename T>
struct Passed {
  T data;
};

template <typename T>
struct Failed {
  std::optional<T> data;
};

struct Skipped {
};

// A collaborator failed; never used for a negative verdict.
struct Errored {
  std::exception_ptr error;
  std::string        message;
};

template <typename T>
using Result = std::variant<Passed<T>, Failed<T>, Skipped, Errored>;

template <typename T>
bool is_passed(Result<T> const& r)
{
  return std::holds_alternative<Passed<T>>(r);
}

template <typename T>
bool is_failed(Result<T> const& r)
{
  return std::holds_alternative<Failed<T>>(r);
}

template <typename T>
bool is_skipped(Result<T> const& r)
{
  return std::holds_alternative<Skipped>(r);
}

template <typename T>
bool is_errored(Result<T> const& r)
{
  return std::holds_alternative<Errored>(r);
}

// The payload of a Passed or Failed result, if any.
template <typename T>
T const* data(Result<T> const& r)
{
  if (auto p = std::get_if<Passed<T>>(&r))
    return &p->data;
  if (auto f = std::get_if<Failed<T>>(&r); f && f->data)
    return &*f->data;
  return nullptr;
}

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

template <typename T>
std::ostream& operator<<(std::ostream& os, Result<T> const& r)
{
  std::visit(overloaded{
                 [&os](Passed<T> const& p) { os << "Passed(" << p.data << ')'; },
                 [&os](Failed<T> const& f) {
                   os << "Failed(";
                   if (f.data)
                     os << *f.data;
                   os << ')';
                 },
                 [&os](Skipped const&) { os << "Skipped"; },
                 [&os](Errored const& e) {
                   os << "Errored(" << e.message << ')';
                 },
             },
             r);
  return os;
}

struct Unit {
};

// One check over a parsed address.  Context carries data produced
// upstream, such as the MX records the SMTP check consumes.

template <typename Output, typename Context = Unit>
class Checker {
public:
  using output_type  = Output;
  using context_type = Context;

  virtual ~Checker() = default;

  virtual char const* name() const = 0;

  virtual Output check(Mailbox const& mbx, Context const& ctx) = 0;
};

// A checker backed by a dataset that can be reloaded.
class Refreshable {
public:
  virtual ~Refreshable() = default;

  virtual void refresh() = 0;
};

} // namespace Check

#endif // CHECK_DOT_HPP
