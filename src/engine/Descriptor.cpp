#include "runcatalog/Descriptor.hpp"

#include "runcatalog/Errors.hpp"

namespace runcatalog {

DescriptorDoc DescriptorDoc::fromJson(const Document& doc) {
    DescriptorDoc d;
    try {
        d.uid = doc.at("uid").get<std::string>();
        for (const auto& item : doc.at("data_keys").items()) {
            const auto& spec = item.value();
            FieldSpec field;
            field.dtype = spec.at("dtype").get<std::string>();
            if (spec.contains("shape") && !spec["shape"].is_null()) {
                field.shape = spec["shape"].get<Shape>();
            }
            d.dataKeys.emplace(item.key(), std::move(field));
        }
    } catch (const nlohmann::json::exception& e) {
        throw MalformedDocument(std::string("event descriptor: ") + e.what());
    }
    d.raw = doc;
    return d;
}

DType fieldDType(const FieldSpec& spec) {
    if (spec.dtype == "number" || spec.dtype == "array") return DType::Float64;
    if (spec.dtype == "integer") return DType::Int64;
    if (spec.dtype == "boolean") return DType::Bool;
    throw UnsupportedDType("event field dtype '" + spec.dtype + "' cannot be read as an array");
}

} // namespace runcatalog
