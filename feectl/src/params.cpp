#include "params.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace {

void require_range(const std::string& field, const Wad& value,
                   const Wad& lo, const Wad& hi) {
    if (value < lo || value > hi) {
        throw InvalidParameter(field + "=" + util::wad_to_string(value) +
                               " outside [" + util::wad_to_string(lo) + ", " +
                               util::wad_to_string(hi) + "]");
    }
}

const nlohmann::json& require_field(const nlohmann::json& j, const std::string& field) {
    if (!j.is_object() || !j.contains(field)) {
        throw InvalidParameter("missing field '" + field + "'");
    }
    return j.at(field);
}

} // namespace

void ParamValidator::validate_bounds(const SanityBounds& bounds) {
    if (bounds.min_period_floor > bounds.min_period_ceil ||
        bounds.min_ratio_tolerance > bounds.max_ratio_tolerance ||
        bounds.min_linear_slope > bounds.max_linear_slope ||
        bounds.min_side_factor > bounds.max_side_factor) {
        throw InvalidParameter("sanity bounds have a lower limit above its upper limit");
    }
    require_range("bounds.max_current_ratio_ceil", bounds.max_current_ratio_ceil,
                  Wad(1), BOUNDS_RATIO_CEIL_LIMIT);
    require_range("bounds.max_ratio_tolerance", bounds.max_ratio_tolerance,
                  Wad(0), BOUNDS_TOLERANCE_LIMIT);
    require_range("bounds.max_linear_slope", bounds.max_linear_slope,
                  Wad(0), BOUNDS_FACTOR_LIMIT);
    require_range("bounds.max_side_factor", bounds.max_side_factor,
                  Wad(0), BOUNDS_FACTOR_LIMIT);
    require_range("bounds.max_adjustment_rate", bounds.max_adjustment_rate,
                  Wad(0), BOUNDS_FACTOR_LIMIT);
}

void ParamValidator::validate_params(const PoolParams& params, const SanityBounds& bounds) {
    if (params.max_fee > MAX_FEE) {
        throw InvalidParameter("max_fee=" + std::to_string(params.max_fee) +
                               " above " + std::to_string(MAX_FEE));
    }
    if (params.min_fee > params.max_fee) {
        throw InvalidParameter("min_fee=" + std::to_string(params.min_fee) +
                               " above max_fee=" + std::to_string(params.max_fee));
    }
    if (params.base_max_fee_delta == 0 || params.base_max_fee_delta > MAX_FEE) {
        throw InvalidParameter("base_max_fee_delta=" + std::to_string(params.base_max_fee_delta) +
                               " outside [1, " + std::to_string(MAX_FEE) + "]");
    }
    if (params.lookback_period == 0 || params.lookback_period > bounds.max_lookback_days) {
        throw InvalidParameter("lookback_period=" + std::to_string(params.lookback_period) +
                               " outside [1, " + std::to_string(bounds.max_lookback_days) + "]");
    }
    if (params.min_period < bounds.min_period_floor || params.min_period > bounds.min_period_ceil) {
        throw InvalidParameter("min_period=" + std::to_string(params.min_period) +
                               " outside [" + std::to_string(bounds.min_period_floor) + ", " +
                               std::to_string(bounds.min_period_ceil) + "]");
    }

    require_range("ratio_tolerance", params.ratio_tolerance,
                  bounds.min_ratio_tolerance, bounds.max_ratio_tolerance);
    require_range("linear_slope", params.linear_slope,
                  bounds.min_linear_slope, bounds.max_linear_slope);
    require_range("max_current_ratio", params.max_current_ratio,
                  Wad(1), bounds.max_current_ratio_ceil);
    require_range("lower_side_factor", params.lower_side_factor,
                  bounds.min_side_factor, bounds.max_side_factor);
    require_range("upper_side_factor", params.upper_side_factor,
                  bounds.min_side_factor, bounds.max_side_factor);
}

void ParamValidator::validate_adjustment_rate(const Wad& rate, const SanityBounds& bounds) {
    require_range("max_adjustment_rate", rate, Wad(1), bounds.max_adjustment_rate);
}

FeeSettings FeeSettings::defaults() {
    FeeSettings settings;

    PoolParams stable;
    stable.min_fee = 10;
    stable.max_fee = 1000;
    stable.base_max_fee_delta = 10;
    stable.lookback_period = 30;
    stable.min_period = 3600;
    stable.ratio_tolerance = util::parse_wad("0.005");
    stable.linear_slope = util::parse_wad("0.5");
    stable.max_current_ratio = WAD * 1000;
    stable.lower_side_factor = WAD;
    stable.upper_side_factor = WAD;

    PoolParams standard;
    standard.min_fee = 100;
    standard.max_fee = 10000;
    standard.base_max_fee_delta = 50;
    standard.lookback_period = 30;
    standard.min_period = 3600;
    standard.ratio_tolerance = util::parse_wad("0.05");
    standard.linear_slope = WAD;
    standard.max_current_ratio = WAD * 1000;
    standard.lower_side_factor = WAD;
    standard.upper_side_factor = WAD;

    PoolParams volatile_params;
    volatile_params.min_fee = 300;
    volatile_params.max_fee = 50000;
    volatile_params.base_max_fee_delta = 150;
    volatile_params.lookback_period = 14;
    volatile_params.min_period = 3600;
    volatile_params.ratio_tolerance = util::parse_wad("0.1");
    volatile_params.linear_slope = WAD * 2;
    volatile_params.max_current_ratio = WAD * 1000;
    volatile_params.lower_side_factor = WAD;
    volatile_params.upper_side_factor = util::parse_wad("1.5");

    settings.categories[PoolCategory::Stable] = stable;
    settings.categories[PoolCategory::Standard] = standard;
    settings.categories[PoolCategory::Volatile] = volatile_params;
    return settings;
}

FeeSettings FeeSettings::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw InvalidParameter("fee settings must be a JSON object");
    }

    FeeSettings settings = defaults();

    if (doc.contains("bounds")) {
        doc.at("bounds").get_to(settings.bounds);
    }
    if (doc.contains("max_adjustment_rate")) {
        settings.max_adjustment_rate = wad_from_json(doc, "max_adjustment_rate");
    }
    if (doc.contains("categories")) {
        const auto& cats = doc.at("categories");
        if (!cats.is_object()) {
            throw InvalidParameter("'categories' must be an object");
        }
        for (auto it = cats.begin(); it != cats.end(); ++it) {
            settings.categories[parse_category(it.key())] = it.value().get<PoolParams>();
        }
    }

    settings.validate();
    return settings;
}

FeeSettings FeeSettings::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InvalidParameter("cannot open fee settings file " + path);
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidParameter("malformed fee settings file " + path + ": " + e.what());
    }

    spdlog::info("Loading fee settings from {}", path);
    return from_json(doc);
}

void FeeSettings::validate() const {
    ParamValidator::validate_bounds(bounds);
    ParamValidator::validate_adjustment_rate(max_adjustment_rate, bounds);
    for (const auto& [category, params] : categories) {
        try {
            ParamValidator::validate_params(params, bounds);
        } catch (const InvalidParameter& e) {
            throw InvalidParameter(category_name(category) + ": " + e.detail());
        }
    }

    spdlog::info("Fee settings validated: {} categories, max adjustment rate {}",
                 categories.size(), util::wad_to_decimal(max_adjustment_rate));
}

Wad wad_from_json(const nlohmann::json& j, const std::string& field) {
    const auto& value = require_field(j, field);
    if (value.is_number_unsigned()) {
        return Wad(value.get<uint64_t>());
    }
    if (!value.is_string()) {
        throw InvalidParameter("field '" + field + "' must be a string or unsigned integer");
    }
    try {
        return util::parse_wad(value.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw InvalidParameter("field '" + field + "': " + e.what());
    }
}

uint64_t uint_from_json(const nlohmann::json& j, const std::string& field, uint64_t max_value) {
    const auto& value = require_field(j, field);
    if (!value.is_number_unsigned()) {
        throw InvalidParameter("field '" + field + "' must be an unsigned integer");
    }
    uint64_t v = value.get<uint64_t>();
    if (v > max_value) {
        throw InvalidParameter("field '" + field + "'=" + std::to_string(v) +
                               " above " + std::to_string(max_value));
    }
    return v;
}

void to_json(nlohmann::json& j, const PoolParams& params) {
    j = {
        {"min_fee", params.min_fee},
        {"max_fee", params.max_fee},
        {"base_max_fee_delta", params.base_max_fee_delta},
        {"lookback_period", params.lookback_period},
        {"min_period", params.min_period},
        {"ratio_tolerance", util::wad_to_string(params.ratio_tolerance)},
        {"linear_slope", util::wad_to_string(params.linear_slope)},
        {"max_current_ratio", util::wad_to_string(params.max_current_ratio)},
        {"lower_side_factor", util::wad_to_string(params.lower_side_factor)},
        {"upper_side_factor", util::wad_to_string(params.upper_side_factor)}
    };
}

void from_json(const nlohmann::json& j, PoolParams& params) {
    constexpr uint64_t u32_max = std::numeric_limits<uint32_t>::max();

    params.min_fee = static_cast<uint32_t>(uint_from_json(j, "min_fee", MAX_FEE));
    params.max_fee = static_cast<uint32_t>(uint_from_json(j, "max_fee", MAX_FEE));
    params.base_max_fee_delta = static_cast<uint32_t>(uint_from_json(j, "base_max_fee_delta", MAX_FEE));
    params.lookback_period = static_cast<uint32_t>(uint_from_json(j, "lookback_period", u32_max));
    params.min_period = uint_from_json(j, "min_period", std::numeric_limits<uint64_t>::max());
    params.ratio_tolerance = wad_from_json(j, "ratio_tolerance");
    params.linear_slope = wad_from_json(j, "linear_slope");
    params.max_current_ratio = wad_from_json(j, "max_current_ratio");
    params.lower_side_factor = wad_from_json(j, "lower_side_factor");
    params.upper_side_factor = wad_from_json(j, "upper_side_factor");
}

void to_json(nlohmann::json& j, const SanityBounds& bounds) {
    j = {
        {"min_period_floor", bounds.min_period_floor},
        {"min_period_ceil", bounds.min_period_ceil},
        {"max_lookback_days", bounds.max_lookback_days},
        {"min_ratio_tolerance", util::wad_to_string(bounds.min_ratio_tolerance)},
        {"max_ratio_tolerance", util::wad_to_string(bounds.max_ratio_tolerance)},
        {"min_linear_slope", util::wad_to_string(bounds.min_linear_slope)},
        {"max_linear_slope", util::wad_to_string(bounds.max_linear_slope)},
        {"min_side_factor", util::wad_to_string(bounds.min_side_factor)},
        {"max_side_factor", util::wad_to_string(bounds.max_side_factor)},
        {"max_current_ratio_ceil", util::wad_to_string(bounds.max_current_ratio_ceil)},
        {"max_adjustment_rate", util::wad_to_string(bounds.max_adjustment_rate)}
    };
}

// Partial override: absent fields keep their compiled-in defaults
void from_json(const nlohmann::json& j, SanityBounds& bounds) {
    if (!j.is_object()) {
        throw InvalidParameter("'bounds' must be an object");
    }
    constexpr uint64_t u64_max = std::numeric_limits<uint64_t>::max();

    if (j.contains("min_period_floor")) bounds.min_period_floor = uint_from_json(j, "min_period_floor", u64_max);
    if (j.contains("min_period_ceil")) bounds.min_period_ceil = uint_from_json(j, "min_period_ceil", u64_max);
    if (j.contains("max_lookback_days")) {
        bounds.max_lookback_days = static_cast<uint32_t>(
            uint_from_json(j, "max_lookback_days", std::numeric_limits<uint32_t>::max()));
    }
    if (j.contains("min_ratio_tolerance")) bounds.min_ratio_tolerance = wad_from_json(j, "min_ratio_tolerance");
    if (j.contains("max_ratio_tolerance")) bounds.max_ratio_tolerance = wad_from_json(j, "max_ratio_tolerance");
    if (j.contains("min_linear_slope")) bounds.min_linear_slope = wad_from_json(j, "min_linear_slope");
    if (j.contains("max_linear_slope")) bounds.max_linear_slope = wad_from_json(j, "max_linear_slope");
    if (j.contains("min_side_factor")) bounds.min_side_factor = wad_from_json(j, "min_side_factor");
    if (j.contains("max_side_factor")) bounds.max_side_factor = wad_from_json(j, "max_side_factor");
    if (j.contains("max_current_ratio_ceil")) bounds.max_current_ratio_ceil = wad_from_json(j, "max_current_ratio_ceil");
    if (j.contains("max_adjustment_rate")) bounds.max_adjustment_rate = wad_from_json(j, "max_adjustment_rate");

    ParamValidator::validate_bounds(bounds);
}
