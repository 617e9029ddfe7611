//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <cmath>

namespace cnc::core::utils {
    constexpr int DEFAULT_PRECISION = 3;

    /**
     * @brief Formatta un numero rimuovendo zeri finali inutili, max default 3 decimali
     */
    inline std::string formatFloat(double value, int precision = DEFAULT_PRECISION) {
        if (std::isnan(value)) return "nan";
        if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

        double factor = std::pow(10.0, precision);
        double rounded = std::round(value * factor) / factor;

        std::ostringstream oss;
        // Fuori dal range di long long: cifre intere senza cast
        if (!std::isfinite(rounded) || std::fabs(value) >= 9.0e18) {
            oss << std::fixed << std::setprecision(0) << value;
            return oss.str();
        }
        if (rounded == std::floor(rounded)) {
            return std::to_string(static_cast<long long>(rounded));
        }

        oss << std::fixed << std::setprecision(precision) << rounded;
        std::string result = oss.str();

        // Rimuovi zeri finali
        size_t end = result.find_last_not_of('0');
        if (end != std::string::npos && result[end] == '.') end--;
        return result.substr(0, end + 1);
    }
} // namespace cnc::core::utils
