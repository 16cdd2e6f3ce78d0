#ifndef DOMAIN_DOT_HPP
#define DOMAIN_DOT_HPP

#include <string>
#include <string_view>

namespace domain {
// A host name in ASCII compatible encoding, everything lower case.
// Pure ASCII is only lower cased; otherwise the name is normalized
// (NFKC) then converted to A-labels.  Throws FormatError when the
// name can't be converted.
std::string to_ascii(std::string_view dom);
} // namespace domain

#endif // DOMAIN_DOT_HPP
