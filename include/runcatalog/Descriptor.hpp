#pragma once

#include <map>
#include <string>

#include "runcatalog/BlockArray.hpp"
#include "runcatalog/DocumentCollection.hpp"

namespace runcatalog {

struct FieldSpec {
    std::string dtype; // "number", "integer", "boolean", "array", "string"
    Shape shape;
};

// Schema of an event stream as declared by one event_descriptor document.
struct DescriptorDoc {
    std::string uid;
    std::map<std::string, FieldSpec> dataKeys;
    Document raw;

    // Throws MalformedDocument when uid or data_keys are missing or mistyped.
    static DescriptorDoc fromJson(const Document& doc);
};

// number/array -> float64, integer -> int64, boolean -> bool. Anything else
// raises UnsupportedDType.
DType fieldDType(const FieldSpec& spec);

} // namespace runcatalog
