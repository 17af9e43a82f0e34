#pragma once

#include <string>
#include <vector>

namespace runcatalog {

// Text analyzer behind the store's $text operator: split on anything that is
// not alphanumeric or '_', lowercase.
class Analyzer {
public:
    static std::vector<std::string> tokenize(const std::string& text);

    // Sorted, de-duplicated terms of a search string.
    static std::vector<std::string> queryTerms(const std::string& text);
};

} // namespace runcatalog
