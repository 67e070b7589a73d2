#pragma once
#include "config.h"

// Масштаб пикселей на метр для одного видео (постоянен на весь прогон).
// Оценка по ширине кадра: дорога занимает road_width_fraction кадра,
// lanes полос по lane_width_m метров; результат ограничивается [min, max].
struct Calibration {
    double pixels_per_meter = 8.0;

    static Calibration from_frame_width(int frame_width, const CalibrationConfig &cfg);
};
