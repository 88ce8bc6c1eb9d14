#pragma once
#include <stdexcept>
#include <string>

namespace datacat {

// Base of everything the library throws on purpose.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Missing index file, table or metadata field.
class NotFoundError : public Error {
public:
  using Error::Error;
};

// Refusal to take over a directory that is not a dataset.
class ConflictError : public Error {
public:
  using Error::Error;
};

// Input rejected: bad format name, table name, document shape, column type.
class ValidationError : public Error {
public:
  using Error::Error;
};

// Underlying open/read/write failure.
class IoError : public Error {
public:
  using Error::Error;
};

// Process-level setup problem (options file, metadata field registration).
class ConfigError : public Error {
public:
  using Error::Error;
};

} // namespace datacat
