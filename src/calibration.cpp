#include "calibration.h"
#include <algorithm>

Calibration Calibration::from_frame_width(int frame_width, const CalibrationConfig &cfg) {
    Calibration c;
    if (cfg.fixed_pixels_per_meter > 0.0) {
        c.pixels_per_meter = cfg.fixed_pixels_per_meter;
        return c;
    }
    const double road_width_px = frame_width * cfg.road_width_fraction;
    const double road_width_m = cfg.lanes * cfg.lane_width_m;
    double ppm = road_width_m > 0.0 ? road_width_px / road_width_m : cfg.max_pixels_per_meter;
    c.pixels_per_meter = std::min(cfg.max_pixels_per_meter, std::max(cfg.min_pixels_per_meter, ppm));
    return c;
}
