#pragma once
// errors.hpp
// Exception types raised by the TF-IDF and topic sweep pipeline.
// Each error keeps the offending identifiers so callers can report them.

#include <stdexcept>
#include <string>
#include <cstddef>

// A document reached tf computation with no surviving tokens
class EmptyDocumentError : public std::runtime_error {
public:
    explicit EmptyDocumentError(const std::string& document_id)
        : std::runtime_error("Document '" + document_id + "' has no surviving tokens"),
          document_id_(document_id) {}

    const std::string& document_id() const { return document_id_; }

private:
    std::string document_id_;
};

// Bad test fraction or too few documents to split
class InvalidSplitError : public std::runtime_error {
public:
    InvalidSplitError(double fraction, std::size_t document_count, const std::string& reason)
        : std::runtime_error("Invalid split (fraction=" + std::to_string(fraction) +
                             ", documents=" + std::to_string(document_count) + "): " + reason),
          fraction_(fraction),
          document_count_(document_count) {}

    double fraction() const { return fraction_; }
    std::size_t document_count() const { return document_count_; }

private:
    double fraction_;
    std::size_t document_count_;
};

// The external modelling capability failed for one K
class ExternalFitFailure : public std::runtime_error {
public:
    ExternalFitFailure(int k, const std::string& reason)
        : std::runtime_error("Fit failed for K=" + std::to_string(k) + ": " + reason),
          k_(k),
          reason_(reason) {}

    int k() const { return k_; }
    const std::string& reason() const { return reason_; }

private:
    int k_;
    std::string reason_;
};

// No K produced a usable perplexity
class SweepFailedError : public std::runtime_error {
public:
    explicit SweepFailedError(const std::string& what) : std::runtime_error(what) {}
};

// Token input could not be read
class TokenStreamError : public std::runtime_error {
public:
    explicit TokenStreamError(const std::string& what) : std::runtime_error(what) {}
};

// Configuration file missing a sane value
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
