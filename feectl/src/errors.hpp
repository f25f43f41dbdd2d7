#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// Base for every failure the fee controller signals. A failed call never
// leaves partial state behind.
class FeeError : public std::runtime_error {
public:
    FeeError(const std::string& kind, const std::string& message);

    const std::string& kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    std::string kind_;
    std::string detail_;
};

class InvalidFee : public FeeError {
public:
    explicit InvalidFee(const std::string& message);
};

class InvalidRatio : public FeeError {
public:
    explicit InvalidRatio(const std::string& message);
};

class InvalidParameter : public FeeError {
public:
    explicit InvalidParameter(const std::string& message);
};

class CooldownNotElapsed : public FeeError {
public:
    CooldownNotElapsed(uint64_t now, uint64_t next_eligible);

    uint64_t now() const { return now_; }
    uint64_t next_eligible() const { return next_eligible_; }

private:
    uint64_t now_;
    uint64_t next_eligible_;
};

class NotActive : public FeeError {
public:
    explicit NotActive(const std::string& pool_id);
};

class UnknownPool : public FeeError {
public:
    explicit UnknownPool(const std::string& pool_id);
};
