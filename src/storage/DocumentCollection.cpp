#include "runcatalog/DocumentCollection.hpp"

namespace runcatalog {

std::optional<Document> DocumentCollection::findOne(const Document& filter) const {
    FindOptions options;
    options.sort = {SortKey{kIdField, 1}};
    options.limit = 1;
    auto docs = find(filter, options);
    if (docs.empty()) {
        return std::nullopt;
    }
    return std::move(docs.front());
}

} // namespace runcatalog
