#include "record_emitter.h"
#include <cmath>
#include <string>

RecordEmitter::RecordEmitter(RecordSink *sink, ProgressCallback progress)
        : sink_(sink), progress_(std::move(progress)) {}

DetectionRecord RecordEmitter::make_record(int frame_index,
                                           double fps,
                                           int vehicle_id,
                                           const Detection &det,
                                           double speed_kmh,
                                           bool is_overspeed,
                                           const std::optional<PlateRead> &plate) {
    DetectionRecord r;
    r.frame_number = frame_index;
    r.vehicle_id = vehicle_id;
    r.speed = speed_kmh;
    if (plate) {
        r.license_plate = plate->text;
        r.license_plate_confidence = plate->confidence;
    }
    r.is_overspeed = is_overspeed;
    r.x1 = static_cast<int>(det.bbox.x);
    r.y1 = static_cast<int>(det.bbox.y);
    r.x2 = static_cast<int>(det.bbox.x + det.bbox.width);
    r.y2 = static_cast<int>(det.bbox.y + det.bbox.height);
    r.confidence = det.confidence;
    r.vehicle_class = vehicle_class_name(det.class_id);
    r.timestamp = fps > 0.0 ? frame_index / fps : 0.0;
    return r;
}

bool RecordEmitter::emit(const DetectionRecord &record) {
    if (!(record.speed > 0.0)) {
        return false;
    }
    records_.push_back(record);
    if (sink_) {
        sink_->write(records_.back());
    }
    return true;
}

void RecordEmitter::report_progress(int frame_index, int total_frames) {
    if (!progress_) {
        return;
    }
    const double pct = total_frames > 0
                       ? static_cast<double>(frame_index) / total_frames * 100.0
                       : 0.0;
    progress_(pct, "Processing frame " + std::to_string(frame_index) + "/" + std::to_string(total_frames));
}
