#pragma once
#include "config.h"

// Зона измерения скорости: горизонтальная полоса кадра [top, bottom]
// во всю ширину. Границы включены.
class SpeedZone {
public:
    SpeedZone() = default;
    SpeedZone(int top, int bottom, double speed_limit_kmh);

    // Зона по высоте кадра: top = int(h * top_fraction), bottom = int(h * bottom_fraction).
    static SpeedZone from_frame_height(int frame_height, const ZoneConfig &cfg);

    bool contains(float center_y) const;

    // Строго больше лимита; ровно на лимите не превышение.
    bool is_overspeed(double speed_kmh) const { return speed_kmh > speed_limit_kmh_; }

    int top() const { return top_; }
    int bottom() const { return bottom_; }
    double speed_limit_kmh() const { return speed_limit_kmh_; }

private:
    int top_ = 0;
    int bottom_ = 0;
    double speed_limit_kmh_ = 80.0;
};
