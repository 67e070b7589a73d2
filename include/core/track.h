#pragma once
#include <array>
#include <optional>
#include <string>
#include <opencv2/core.hpp>
#include "core/ring_buffer.h"

// Ёмкость истории позиций трека.
static constexpr std::size_t TRACK_HISTORY_CAPACITY = 15;

struct PositionSample {
    cv::Point2f position{0.0f, 0.0f}; // - центр bbox (пиксели).
    int frame_index = 0; // - номер кадра (с 1).
    double timestamp = 0.0; // - время кадра от начала видео (секунды).
};

// Прочитанный номер. Четырёхугольник задан в координатах кропа машины.
struct PlateRead {
    std::string text; // - нормализованный текст (только [A-Za-z0-9]).
    double confidence = 0.0; // - уверенность OCR [0..1].
    std::array<cv::Point2f, 4> quad{}; // - TL, TR, BR, BL.
    int frame_index = 0; // - кадр, на котором номер прочитан.
};

struct Track {
    int id = -1; // - идентификатор машины, не переиспользуется.
    RingBuffer<PositionSample, TRACK_HISTORY_CAPACITY> history; // - последние позиции, старые вытесняются.
    int last_seen_frame = 0; // - кадр последнего совпадения.
    std::optional<double> smoothed_speed_kmh; // - сглаженная скорость; нет, пока не было ни одной оценки.
    std::optional<PlateRead> plate; // - последний принятый номер; живёт, пока его кадр в history.

    bool has_position() const { return !history.empty(); }
    const cv::Point2f &last_position() const { return history.back().position; }
};
