#pragma once
#include <string>

// Одна зафиксированная детекция машины на кадре. После выдачи не меняется.
struct DetectionRecord {
    int frame_number = 0;
    int vehicle_id = -1;
    double speed = 0.0; // - км/ч
    std::string license_plate = "unknown";
    double license_plate_confidence = 0.0;
    bool is_overspeed = false;
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;
    float confidence = 0.0f; // - уверенность детектора.
    std::string vehicle_class = "unknown";
    double timestamp = 0.0; // - секунды от начала видео.
};

// Приёмник записей (табличное хранилище).
class RecordSink {
public:
    virtual ~RecordSink() = default;

    // Бросает std::runtime_error, если приёмник нельзя открыть.
    virtual void open() = 0;
    virtual void write(const DetectionRecord &record) = 0;
    virtual void flush() = 0;
    virtual void close() = 0;
};
