#include "PromptMatcher.hpp"

#include "SpecterErrors.hpp"

namespace specter {
PromptMatcher::PromptMatcher(const vector<string>& patterns)
    : sources(patterns) {
  for (const auto& pattern : patterns) {
    try {
      compiled.emplace_back(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& re) {
      throw ConfigurationError("Invalid prompt regex '" + pattern +
                               "': " + re.what());
    }
  }
}

optional<string> PromptMatcher::match(const string& text) const {
  for (size_t a = 0; a < compiled.size(); a++) {
    if (std::regex_search(text, compiled[a])) {
      return sources[a];
    }
  }
  return {};
}
}  // namespace specter
