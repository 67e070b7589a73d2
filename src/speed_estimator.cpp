#include "speed_estimator.h"
#include "util/geometry.h"

#include <algorithm>
#include <iostream>

static constexpr double MPS_TO_KMH = 3.6;

SpeedEstimator::SpeedEstimator(const SpeedConfig &cfg, const Calibration &calibration, bool log)
        : cfg_(cfg), calibration_(calibration), log_(log) {}

bool SpeedEstimator::instant_speed(const PositionSample &older,
                                   const PositionSample &newer,
                                   double &out_kmh) const {
    const double distance_px = util::distance(older.position, newer.position);
    const double dt = newer.timestamp - older.timestamp;
    // деление на ноль и дрожание bbox
    if (dt <= 0.0 || distance_px <= cfg_.min_displacement_px) {
        return false;
    }
    if (calibration_.pixels_per_meter <= 0.0) {
        return false;
    }
    const double distance_m = distance_px / calibration_.pixels_per_meter;
    const double kmh = distance_m / dt * MPS_TO_KMH * cfg_.correction_factor;
    if (kmh <= 0.0 || kmh >= cfg_.max_plausible_kmh) {
        return false;
    }
    out_kmh = kmh;
    return true;
}

bool SpeedEstimator::raw_estimate(const Track &track, double &out_kmh) const {
    const std::size_t n = track.history.size();
    if (n < 2) {
        return false;
    }
    const std::size_t intervals = std::min(n - 1, static_cast<std::size_t>(std::max(1, cfg_.max_intervals)));

    double sum = 0.0;
    int count = 0;
    // от самых свежих интервалов к старым
    for (std::size_t i = 0; i < intervals; ++i) {
        const PositionSample &newer = track.history.back_at(i);
        const PositionSample &older = track.history.back_at(i + 1);
        double kmh = 0.0;
        if (instant_speed(older, newer, kmh)) {
            sum += kmh;
            ++count;
        }
    }
    if (count == 0) {
        return false;
    }
    out_kmh = sum / count;
    return true;
}

double SpeedEstimator::update(Track &track, const PositionSample &sample) const {
    track.history.push_back(sample);

    if (static_cast<int>(track.history.size()) < cfg_.min_samples) {
        return 0.0;
    }

    double raw = 0.0;
    if (!raw_estimate(track, raw)) {
        return track.smoothed_speed_kmh.value_or(0.0);
    }

    double smoothed = raw;
    if (track.smoothed_speed_kmh) {
        smoothed = cfg_.smoothing_alpha * raw + (1.0 - cfg_.smoothing_alpha) * *track.smoothed_speed_kmh;
    }
    track.smoothed_speed_kmh = smoothed;

    if (log_) {
        std::cout << "[SPD] id=" << track.id
                  << " frame=" << sample.frame_index
                  << " raw=" << raw
                  << " smoothed=" << smoothed << std::endl;
    }
    return smoothed;
}
