#ifndef TLD_DOT_HPP
#define TLD_DOT_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class Provider;

// Public suffix rules as a trie keyed by label, top level domain
// first.  A reload builds a new trie off to the side and swaps it in,
// lookups work on whatever trie was current when they started.

class TLD {
public:
  TLD(TLD const&) = delete;
  TLD& operator=(TLD const&) = delete;

  // Custom rules are applied after the provider's rules.
  explicit TLD(std::unique_ptr<Provider> provider,
               std::vector<std::string>  custom_rules = {});

  // Rules only, no provider: refresh() just rebuilds from these.
  explicit TLD(std::vector<std::string> rules);

  // Reload from the provider; on failure the current trie stays.
  void refresh();

  // The registrable domain of hostname, if it has one.
  std::optional<std::string>
  get_registered_domain(std::string_view hostname) const;

  size_t size() const;

  static bool is_rule(std::string_view rule);

private:
  struct Node {
    std::unordered_map<std::string, std::unique_ptr<Node>> children;

    bool is_suffix{false};
    bool is_exception{false};
    bool is_wildcard{false};
  };

  struct Trie {
    Node   root;
    size_t rules{0};

    void add(std::string_view rule);
  };

  std::shared_ptr<Trie const> build_(std::vector<std::string> const& rules) const;
  std::shared_ptr<Trie const> current_() const;

  std::unique_ptr<Provider> provider_;
  std::vector<std::string>  custom_rules_;

  mutable std::mutex          mtx_;
  std::shared_ptr<Trie const> trie_;
};

#endif // TLD_DOT_HPP
