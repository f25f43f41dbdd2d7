#include "errors.hpp"

FeeError::FeeError(const std::string& kind, const std::string& message)
    : std::runtime_error(kind + ": " + message)
    , kind_(kind)
    , detail_(message)
{}

InvalidFee::InvalidFee(const std::string& message)
    : FeeError("InvalidFee", message) {}

InvalidRatio::InvalidRatio(const std::string& message)
    : FeeError("InvalidRatio", message) {}

InvalidParameter::InvalidParameter(const std::string& message)
    : FeeError("InvalidParameter", message) {}

CooldownNotElapsed::CooldownNotElapsed(uint64_t now, uint64_t next_eligible)
    : FeeError("CooldownNotElapsed",
               "now=" + std::to_string(now) + " next_eligible=" + std::to_string(next_eligible))
    , now_(now)
    , next_eligible_(next_eligible)
{}

NotActive::NotActive(const std::string& pool_id)
    : FeeError("NotActive", "pool " + pool_id + " is not active") {}

UnknownPool::UnknownPool(const std::string& pool_id)
    : FeeError("UnknownPool", "no pool registered as " + pool_id) {}
