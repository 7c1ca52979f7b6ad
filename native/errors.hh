#pragma once

#include <stdexcept>
#include <string>
#include <utility>

class DictstoreError : public std::runtime_error {
   public:
    explicit DictstoreError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised when querying a root directory that was never imported into.
class StoreMissingError : public DictstoreError {
   public:
    using DictstoreError::DictstoreError;
};

class NotFoundError : public DictstoreError {
   public:
    using DictstoreError::DictstoreError;
};

// The import input lacks the "# XX-YY vocabulary database" header.
class FormatError : public DictstoreError {
   public:
    using DictstoreError::DictstoreError;
};

class MalformedLineError : public DictstoreError {
   public:
    MalformedLineError(const std::string& message, size_t line_number)
        : DictstoreError(message), line_number_(line_number) {}

    size_t line_number() const { return line_number_; }

   private:
    size_t line_number_;
};

// Stored or imported bytes are not valid UTF-8, or stored data is
// structurally broken.
class DecodeError : public DictstoreError {
   public:
    using DictstoreError::DictstoreError;
};

class PatternError : public DictstoreError {
   public:
    using DictstoreError::DictstoreError;
};

// At least one direction failed while another one produced output.
class QueryError : public DictstoreError {
   public:
    QueryError(const std::string& message, std::string partial_result)
        : DictstoreError(message), partial_result_(std::move(partial_result)) {}

    const std::string& partial_result() const { return partial_result_; }

   private:
    std::string partial_result_;
};
