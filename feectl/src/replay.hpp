#pragma once

#include "registry.hpp"
#include "config.hpp"
#include "params.hpp"
#include "clock.hpp"
#include "types.hpp"
#include <string>
#include <nlohmann/json.hpp>

// Drives a registry from newline-delimited JSON events. An event's "ts"
// moves the replay clock forward; a smaller "ts" is ignored.
class ReplaySession {
public:
    ReplaySession(FeeControllerRegistry& registry, ManualClock& clock);

    // Applies one event and returns its result object. Throws FeeError for
    // rejected operations and nlohmann::json::exception for malformed events.
    nlohmann::json handle_event(const nlohmann::json& event);

    // Parses and applies one line; failures are returned as {"ok": false, ...}
    nlohmann::json process_line(const std::string& line);

    int processed() const { return processed_; }
    int failed() const { return failed_; }

private:
    FeeControllerRegistry& registry_;
    ManualClock& clock_;
    int processed_ = 0;
    int failed_ = 0;
};

nlohmann::json update_to_json(const std::string& pool_id, const FeeUpdate& update);

// Startup state for the replay tool: the snapshot at config.state_file when
// it exists, otherwise a fresh registry from settings. Fee logic uses the
// configured DeltaCapPolicy and the MAX_ADJUSTMENT_RATE override is applied.
FeeControllerRegistry load_registry(const Config& config, const FeeSettings& settings,
                                    const Clock& clock);
