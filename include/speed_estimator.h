#pragma once

#include "core/track.h"
#include "calibration.h"
#include "config.h"

// Оценка скорости трека (км/ч) по истории позиций:
// конечные разности по последним max_intervals интервалам, фильтр шума и
// неправдоподобных значений, среднее, затем экспоненциальное сглаживание
// между кадрами.
class SpeedEstimator {
public:
    SpeedEstimator(const SpeedConfig &cfg, const Calibration &calibration, bool log = false);

    // Добавляет отсчёт в историю трека и возвращает текущую скорость.
    // 0, пока в истории меньше min_samples точек.
    double update(Track &track, const PositionSample &sample) const;

    // Среднее по допустимым мгновенным скоростям. false, если ни одна не прошла фильтр.
    bool raw_estimate(const Track &track, double &out_kmh) const;

    // Мгновенная скорость между двумя отсчётами. false для шума/неправдоподобных значений.
    bool instant_speed(const PositionSample &older, const PositionSample &newer, double &out_kmh) const;

    void set_calibration(const Calibration &calibration) { calibration_ = calibration; }
    const Calibration &calibration() const { return calibration_; }

private:
    SpeedConfig cfg_;
    Calibration calibration_;
    bool log_ = false;
};
