#ifndef ERRORS_DOT_HPP
#define ERRORS_DOT_HPP

#include <stdexcept>
#include <string>

// Malformed address text.
class FormatError : public std::invalid_argument {
public:
  explicit FormatError(std::string const& what)
    : std::invalid_argument(what)
  {
  }
};

// A collaborator (HTTP endpoint, DNS backend, mail exchanger, data
// file) could not be reached or gave an unusable answer.
class ConnectionError : public std::runtime_error {
public:
  explicit ConnectionError(std::string const& what)
    : std::runtime_error(what)
  {
  }
};

#endif // ERRORS_DOT_HPP
