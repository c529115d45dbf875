#ifndef __SPECTER_PROMPT_MATCHER__
#define __SPECTER_PROMPT_MATCHER__

#include "Headers.hpp"

namespace specter {
/**
 * @brief The user-registered patterns that recognize a program waiting for
 * input.
 */
class PromptMatcher {
 public:
  /**
   * @brief Compiles every pattern as an ECMAScript regex.
   * @throws ConfigurationError naming the first pattern that does not compile.
   */
  explicit PromptMatcher(const vector<string>& patterns);

  /**
   * @brief Searches `text` with each pattern in registration order.
   * @return The source text of the first pattern that matches.
   */
  optional<string> match(const string& text) const;

  bool empty() const { return compiled.empty(); }
  size_t size() const { return compiled.size(); }
  const vector<string>& getPatterns() const { return sources; }

 protected:
  vector<string> sources;
  vector<std::regex> compiled;
};
}  // namespace specter

#endif  // __SPECTER_PROMPT_MATCHER__
