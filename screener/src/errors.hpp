#pragma once

#include <stdexcept>
#include <string>

// Transport-level failure (connection refused, timeout, TLS...)
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what) : std::runtime_error(what) {}
};

// One provider could not deliver a usable payload. Retried, then failed over.
class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& what) : std::runtime_error(what) {}
};

// Every configured provider failed for a symbol.
class DataUnavailable : public std::runtime_error {
public:
    explicit DataUnavailable(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Regime classification cannot proceed for this run.
class RegimeError : public std::runtime_error {
public:
    explicit RegimeError(const std::string& what) : std::runtime_error(what) {}
};

class NoTradingDay : public RegimeError {
public:
    explicit NoTradingDay(const std::string& what) : RegimeError(what) {}
};

class InsufficientHistory : public RegimeError {
public:
    explicit InsufficientHistory(const std::string& what) : RegimeError(what) {}
};

class AlignmentFailure : public RegimeError {
public:
    explicit AlignmentFailure(const std::string& what) : RegimeError(what) {}
};
