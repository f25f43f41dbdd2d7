#pragma once

#include "types.hpp"
#include "fee_math.hpp"
#include <string>
#include <cstdlib>

struct Config {
    // Fee settings (bounds, category params); empty = compiled-in defaults
    std::string params_file;

    // Snapshot restored at startup and written on exit; empty = none
    std::string state_file;

    // Global adjustment-rate ceiling, overrides the settings file when set
    std::string max_adjustment_rate;

    // Minimum out-of-band fee move in fee units; empty = DeltaCapPolicy default
    std::string fee_delta_allowance;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;
    Wad adjustment_rate_override() const;
    DeltaCapPolicy delta_cap_policy() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
};
