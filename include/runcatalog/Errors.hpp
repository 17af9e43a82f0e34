#pragma once

#include <stdexcept>
#include <string>

namespace runcatalog {

// Base of every error raised by the catalog layers.
class CatalogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NotFound : public CatalogError {
public:
    explicit NotFound(const std::string& key)
        : CatalogError("key not found: " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class UnsupportedQueryKind : public CatalogError {
public:
    explicit UnsupportedQueryKind(const std::string& tag)
        : CatalogError("no translator registered for query kind '" + tag + "'"), tag_(tag) {}

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

class EmptyStream : public CatalogError {
public:
    using CatalogError::CatalogError;
};

class ConfigurationError : public CatalogError {
public:
    using CatalogError::CatalogError;
};

class AlreadyAuthenticated : public CatalogError {
public:
    using CatalogError::CatalogError;
};

class IndexOutOfRange : public CatalogError {
public:
    using CatalogError::CatalogError;
};

class BlockFetchFailure : public CatalogError {
public:
    using CatalogError::CatalogError;
};

class UnsupportedDType : public CatalogError {
public:
    using CatalogError::CatalogError;
};

class MalformedDocument : public CatalogError {
public:
    using CatalogError::CatalogError;
};

// Raised by the in-process store for filters or pipelines it cannot evaluate.
class StoreError : public CatalogError {
public:
    using CatalogError::CatalogError;
};

} // namespace runcatalog
