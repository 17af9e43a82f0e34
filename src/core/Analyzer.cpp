#include "runcatalog/Analyzer.hpp"

#include <algorithm>
#include <cctype>

namespace runcatalog {

std::vector<std::string> Analyzer::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (unsigned char ch : text) {
        if (std::isalnum(ch) || ch == '_') {
            current.push_back(static_cast<char>(std::tolower(ch)));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

std::vector<std::string> Analyzer::queryTerms(const std::string& text) {
    auto terms = tokenize(text);
    std::sort(terms.begin(), terms.end());
    terms.erase(std::unique(terms.begin(), terms.end()), terms.end());
    return terms;
}

} // namespace runcatalog
