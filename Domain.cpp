#include "Domain.hpp"

#include "Errors.hpp"
#include "is_ascii.hpp"

#include <cstdlib>

#include <idn2.h>
#include <uninorm.h>

#include <glog/logging.h>

#include <fmt/format.h>

#include <boost/algorithm/string/case_conv.hpp>

namespace {
// Normalization Form KC (NFKC) Compatibility Decomposition, followed
// by Canonical Composition, see <http://unicode.org/reports/tr15/>

std::string nfkc(std::string_view str)
{
  size_t length = 0;
  auto   udata  = reinterpret_cast<uint8_t const*>(str.data());
  auto   norm = u8_normalize(UNINORM_NFKC, udata, str.size(), nullptr, &length);
  if (norm == nullptr) {
    throw FormatError(fmt::format("can't normalize «{}»", str));
  }
  std::string ret{reinterpret_cast<char const*>(norm), length};
  free(norm);
  return ret;
}
} // namespace

namespace domain {
std::string to_ascii(std::string_view dom)
{
  if (is_ascii(dom)) {
    // idn2 is pickier than we want about ASCII names, leave syntax
    // decisions for later.
    return boost::algorithm::to_lower_copy(std::string(dom));
  }

  auto const norm = nfkc(dom);

  char* ptr  = nullptr;
  auto  code = idn2_to_ascii_8z(norm.c_str(), &ptr, IDN2_TRANSITIONAL);
  if (code != IDN2_OK) {
    throw FormatError(fmt::format("can't convert «{}» to A-labels: {}", dom,
                                  idn2_strerror(code)));
  }
  std::string ascii(ptr);
  idn2_free(ptr);

  boost::algorithm::to_lower(ascii);
  return ascii;
}
} // namespace domain
