#include "Mailbox.hpp"

#include "Domain.hpp"
#include "Errors.hpp"

#include <algorithm>

#include <fmt/format.h>

Mailbox Mailbox::parse(std::string_view address)
{
  auto const ats = std::count(begin(address), end(address), '@');
  if (ats != 1) {
    throw FormatError(
        fmt::format("«{}» must have exactly one '@', found {}", address, ats));
  }

  auto const at    = address.find('@');
  auto const local = address.substr(0, at);
  auto const host  = address.substr(at + 1);

  Mailbox mbx;
  mbx.hostname_ = domain::to_ascii(host);

  if (auto const plus = local.find('+'); plus != std::string_view::npos) {
    mbx.username_ = local.substr(0, plus);
    mbx.plus_tag_ = local.substr(plus + 1);
  }
  else {
    mbx.username_ = local;
  }

  return mbx;
}

bool Mailbox::validate(std::string_view address,
                       std::string&     msg,
                       Mailbox&         mbx)
{
  try {
    mbx = parse(address);
  }
  catch (FormatError const& e) {
    msg = e.what();
    return false;
  }
  return true;
}

std::string Mailbox::as_string() const
{
  if (plus_tag_.empty())
    return without_tag();
  return fmt::format("{}+{}@{}", username_, plus_tag_, hostname_);
}

std::string Mailbox::without_tag() const
{
  return fmt::format("{}@{}", username_, hostname_);
}
