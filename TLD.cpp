#include "TLD.hpp"

#include "Domain.hpp"
#include "Errors.hpp"
#include "Provider.hpp"
#include "imemstream.hpp"
#include "is_ascii.hpp"

#include <algorithm>

#include <glog/logging.h>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace PSL {
// clang-format off

using dot = one<'.'>;

struct label : plus<sor<ALPHA, DIGIT, one<'-'>>> {};

struct exception_mark : one<'!'> {};

struct wildcard : seq<one<'*'>, dot> {};

struct rule : seq<opt<exception_mark>, opt<wildcard>, list<label, dot>, eof> {};

// clang-format on
} // namespace PSL

namespace {
std::vector<std::string> reversed_labels(std::string const& name)
{
  std::vector<std::string> labels;
  boost::algorithm::split(labels, name, boost::algorithm::is_any_of("."));
  std::reverse(begin(labels), end(labels));
  return labels;
}

std::vector<std::string> split_lines(std::string_view text)
{
  std::vector<std::string> lines;

  imemstream  stream{text};
  std::string line;
  while (std::getline(stream, line))
    lines.push_back(line);

  return lines;
}

// Trimmed and lower cased, Unicode labels as A-labels, any leading
// "!" and "*." kept.  Empty for a blank line or one that can't be
// converted.
std::string normalize_rule(std::string_view line)
{
  auto const rule = boost::algorithm::trim_copy(std::string(line));
  if (is_ascii(rule))
    return boost::algorithm::to_lower_copy(rule);

  auto const marks = rule.find_first_not_of("!*.");
  try {
    return rule.substr(0, marks) + domain::to_ascii(rule.substr(marks));
  }
  catch (FormatError const& e) {
    LOG(WARNING) << "skipping suffix rule: " << e.what();
  }
  return {};
}
} // namespace

bool TLD::is_rule(std::string_view rule)
{
  memory_input<> in(rule.data(), rule.size(), "rule");
  return parse<PSL::rule>(in);
}

void TLD::Trie::add(std::string_view rule_in)
{
  auto rule = boost::algorithm::to_lower_copy(
      boost::algorithm::trim_copy(std::string(rule_in)));

  auto const exception = !rule.empty() && (rule.front() == '!');
  if (exception)
    rule.erase(0, 1);

  auto  wildcard = false;
  Node* node     = &root;
  for (auto const& label : reversed_labels(rule)) {
    if (label == "*") {
      wildcard = true;
      continue;
    }
    auto& child = node->children[label];
    if (!child)
      child = std::make_unique<Node>();
    node = child.get();
  }

  if (wildcard) {
    auto& star = node->children["*"];
    if (!star)
      star = std::make_unique<Node>();
    star->is_suffix   = true;
    star->is_wildcard = true;
  }
  else {
    node->is_suffix = true;
  }
  if (exception)
    node->is_exception = true;

  ++rules;
}

TLD::TLD(std::unique_ptr<Provider> provider,
         std::vector<std::string>  custom_rules)
  : provider_(std::move(provider))
  , custom_rules_(std::move(custom_rules))
{
  refresh();
}

TLD::TLD(std::vector<std::string> rules)
  : custom_rules_(std::move(rules))
{
  refresh();
}

void TLD::refresh()
{
  std::vector<std::string> rules;
  if (provider_) {
    rules = split_lines(provider_->obtain());
    LOG(INFO) << "read " << rules.size() << " lines from " << provider_->name();
  }
  rules.insert(end(rules), begin(custom_rules_), end(custom_rules_));

  auto trie = build_(rules);

  std::lock_guard<std::mutex> lock(mtx_);
  trie_ = std::move(trie);
}

std::shared_ptr<TLD::Trie const>
TLD::build_(std::vector<std::string> const& rules) const
{
  auto trie = std::make_shared<Trie>();
  for (auto const& line : rules) {
    auto const rule = normalize_rule(line);
    if (rule.empty())
      continue;
    if (!is_rule(rule)) {
      LOG(WARNING) << "skipping invalid suffix rule «" << rule << "»";
      continue;
    }
    trie->add(rule);
  }
  LOG(INFO) << "suffix trie built from " << trie->rules << " rules";
  return trie;
}

std::shared_ptr<TLD::Trie const> TLD::current_() const
{
  std::lock_guard<std::mutex> lock(mtx_);
  return trie_;
}

size_t TLD::size() const { return current_()->rules; }

std::optional<std::string>
TLD::get_registered_domain(std::string_view hostname) const
{
  auto const labels = reversed_labels(
      boost::algorithm::to_lower_copy(std::string(hostname)));

  // Top level domains are not registrable.
  if (labels.size() < 2)
    return {};
  if (std::any_of(begin(labels), end(labels),
                  [](auto const& l) { return l.empty(); }))
    return {};

  auto const trie = current_();

  Node const* node = &trie->root;
  size_t      match_len{0};
  std::string suffix;

  for (size_t i = 0; i < labels.size(); ++i) {
    auto child = node->children.find(labels[i]);
    if (child == node->children.end())
      child = node->children.find("*");
    if (child == node->children.end())
      break;

    suffix = suffix.empty() ? labels[i] : labels[i] + '.' + suffix;
    node   = child->second.get();

    if (node->is_exception)
      return suffix;
    if (node->is_suffix || node->is_wildcard)
      match_len = i + 1;
  }

  if ((match_len == 0) || (labels.size() <= match_len))
    return {};

  std::vector<std::string> registrable(labels.begin(),
                                       labels.begin() + match_len + 1);
  std::reverse(begin(registrable), end(registrable));
  return boost::algorithm::join(registrable, ".");
}
