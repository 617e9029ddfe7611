//
// Created by Andrea on 19/10/2026.
//

#pragma once

namespace cnc::core::types {

    /**
     * @brief Posizione degli assi, sempre in millimetri.
     */
    struct Position {
        double x = 0.0;
        double y = 0.0;
        double z = 0.0;

        bool operator==(const Position &other) const {
            return x == other.x && y == other.y && z == other.z;
        }

        bool operator!=(const Position &other) const {
            return !(*this == other);
        }
    };

} // namespace cnc::core::types
