// ---------------------------------------------------------------------------
// cost_estimator.cpp
// ---------------------------------------------------------------------------

#include "policy/cost_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace {

constexpr double kBytesPerTib = 1099511627776.0;  // 2^40

}  // namespace

std::int64_t estimate_bytes(std::string_view sql, const CostLimits& limits) {
    const std::int64_t cap = limits.per_query_max_bytes_with_approval + 1;
    const auto length = static_cast<std::int64_t>(sql.size());
    if (limits.bytes_per_sql_char > 0 && length > cap / limits.bytes_per_sql_char) {
        return cap;
    }
    return std::min(length * limits.bytes_per_sql_char, cap);
}

double estimate_cost_usd(std::int64_t bytes, const CostLimits& limits) {
    const double raw = static_cast<double>(bytes) / kBytesPerTib * limits.usd_per_tib;
    return std::round(raw * 10000.0) / 10000.0;
}
