#include "speed_zone.h"

SpeedZone::SpeedZone(int top, int bottom, double speed_limit_kmh)
        : top_(top), bottom_(bottom), speed_limit_kmh_(speed_limit_kmh) {}

SpeedZone SpeedZone::from_frame_height(int frame_height, const ZoneConfig &cfg) {
    return SpeedZone(static_cast<int>(frame_height * cfg.top_fraction),
                     static_cast<int>(frame_height * cfg.bottom_fraction),
                     cfg.speed_limit_kmh);
}

bool SpeedZone::contains(float center_y) const {
    return center_y >= static_cast<float>(top_) && center_y <= static_cast<float>(bottom_);
}
