#pragma once
#include <optional>
#include <vector>

#include "core/track.h"
#include "detect/detection.h"
#include "detection_record.h"
#include "progress.h"

// Формирует DetectionRecord для детекций с ненулевой скоростью,
// складывает их в поток прогона и передаёт в RecordSink.
// Зона на запись не влияет (только на отрисовку).
class RecordEmitter {
public:
    RecordEmitter(RecordSink *sink, ProgressCallback progress);

    static DetectionRecord make_record(int frame_index,
                                       double fps,
                                       int vehicle_id,
                                       const Detection &det,
                                       double speed_kmh,
                                       bool is_overspeed,
                                       const std::optional<PlateRead> &plate);

    // false, если скорость нулевая и запись не выдана.
    bool emit(const DetectionRecord &record);

    // Раз в кадр: (frame_index / total_frames * 100, "Processing frame N/T").
    void report_progress(int frame_index, int total_frames);

    const std::vector<DetectionRecord> &records() const { return records_; }
    std::size_t count() const { return records_.size(); }

private:
    RecordSink *sink_ = nullptr; // - может быть nullptr (только поток в памяти).
    ProgressCallback progress_;
    std::vector<DetectionRecord> records_;
};
