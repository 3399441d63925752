// papermake/common/error.h
#ifndef PAPERMAKE_COMMON_ERROR_H
#define PAPERMAKE_COMMON_ERROR_H

#include <stdexcept>
#include <string>

namespace papermake {

class PapermakeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed schema definition (duplicate field names, unknown type tags)
class SchemaError : public PapermakeError {
public:
    using PapermakeError::PapermakeError;
};

// Building or updating a World failed; fatal for the render
class AdapterError : public PapermakeError {
public:
    using PapermakeError::PapermakeError;
};

// Writing the compiled document as PDF failed; fatal for the render
class EncodeError : public PapermakeError {
public:
    using PapermakeError::PapermakeError;
};

class StorageError : public PapermakeError {
public:
    using PapermakeError::PapermakeError;
};

class NotFoundError : public StorageError {
public:
    using StorageError::StorageError;
};

class ConfigError : public PapermakeError {
public:
    using PapermakeError::PapermakeError;
};

} // namespace papermake

#endif // PAPERMAKE_COMMON_ERROR_H
