#include "speed_pipeline.h"
#include "util/geometry.h"

#include <chrono>
#include <iomanip>
#include <iostream>

static constexpr double DEFAULT_FPS = 30.0;

SpeedPipeline::SpeedPipeline(ObjectDetector &detector, TextRecognizer &recognizer, const AppConfig &cfg)
        : detector_(detector),
          cfg_(cfg),
          store_(cfg.tracker, cfg.logging.tracker_level_logger),
          resolver_(store_, cfg.tracker, cfg.logging.tracker_level_logger),
          estimator_(cfg.speed, Calibration{}, cfg.logging.speed_level_logger),
          plates_(recognizer, cfg.plate, cfg.logging.plate_level_logger),
          overlay_(cfg.overlay) {}

void SpeedPipeline::begin(const VideoInfo &info) {
    info_ = info;
    fps_ = info.fps > 0.0 ? info.fps : DEFAULT_FPS;
    calibration_ = Calibration::from_frame_width(info.width, cfg_.calibration);
    zone_ = SpeedZone::from_frame_height(info.height, cfg_.zone);
    estimator_.set_calibration(calibration_);
    store_.reset();

    if (cfg_.logging.pipeline_level_logger) {
        std::cout << "[PIPE] video " << info.width << "x" << info.height
                  << " fps=" << fps_
                  << " frames=" << info.total_frames << std::endl;
        std::cout << "[PIPE] scale: " << std::fixed << std::setprecision(2)
                  << calibration_.pixels_per_meter << " pixels per meter"
                  << std::defaultfloat << std::endl;
        std::cout << "[PIPE] zone: y=" << zone_.top() << ".." << zone_.bottom()
                  << " limit=" << zone_.speed_limit_kmh() << " km/h" << std::endl;
    }
}

std::vector<Detection> SpeedPipeline::detect(const cv::Mat &frame, int frame_index) {
    std::vector<Detection> raw;
    try {
        raw = detector_.detect(frame);
    } catch (const std::exception &e) {
        // кадр без детекций, прогон продолжается
        std::cerr << "[DET] frame " << frame_index << " detect failed: " << e.what() << std::endl;
        return {};
    }
    std::vector<Detection> vehicles = filter_vehicle_detections(raw, cfg_.intake, frame.size());
    if (cfg_.logging.detector_level_logger) {
        std::cout << "[DET] frame=" << frame_index
                  << " raw=" << raw.size()
                  << " vehicles=" << vehicles.size() << std::endl;
    }
    return vehicles;
}

std::size_t SpeedPipeline::process_frame(cv::Mat &frame, int frame_index, RecordEmitter &emitter) {
    const std::vector<Detection> detections = detect(frame, frame_index);

    // Старение один раз за кадр, до сопоставления.
    store_.age_out(frame_index);

    // Кропы номеров берём с чистого кадра, а не с уже размеченного.
    const cv::Mat clean = overlay_.enabled() ? frame.clone() : frame;
    const double timestamp = frame_index / fps_;

    for (const auto &det : detections) {
        const cv::Point2f c = det.centroid();
        const int id = resolver_.resolve(c, frame_index);
        Track *track = store_.find(id);
        if (!track) {
            continue;
        }

        PositionSample sample;
        sample.position = c;
        sample.frame_index = frame_index;
        sample.timestamp = timestamp;
        const double speed = estimator_.update(*track, sample);

        const cv::Rect roi = util::toPixelRoi(det.bbox, clean.size());
        const cv::Mat crop = roi.area() > 0 ? clean(roi) : cv::Mat();
        const PlateFusion::Outcome plate = plates_.resolve(*track, speed, frame_index, crop);

        const bool in_zone = zone_.contains(c.y);
        const bool overspeed = zone_.is_overspeed(speed);

        OverlayRenderer::VehicleAnnotation a;
        a.bbox = det.bbox;
        a.vehicle_id = id;
        a.speed_kmh = speed;
        a.in_zone = in_zone;
        a.is_overspeed = overspeed;
        a.plate = plate.plate;
        overlay_.draw_vehicle(frame, a);

        emitter.emit(RecordEmitter::make_record(frame_index, fps_, id, det, speed, overspeed, plate.plate));
    }

    overlay_.draw_frame_info(frame, zone_, frame_index, info_.total_frames, detections.size());
    return detections.size();
}

std::size_t SpeedPipeline::process(FrameSource &source, FrameSink *sink, RecordEmitter &emitter) {
    begin(source.info());

    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();
    const int total = info_.total_frames;

    int frame_index = 0;
    int skipped = 0;
    cv::Mat frame;
    while (true) {
        const FrameStatus st = source.read(frame);
        if (st == FrameStatus::End) {
            break;
        }
        ++frame_index;
        emitter.report_progress(frame_index, total);

        if (st == FrameStatus::Skipped || frame.empty()) {
            ++skipped;
            std::cerr << "[PIPE] frame " << frame_index << " unreadable, skipped" << std::endl;
            continue;
        }

        process_frame(frame, frame_index, emitter);
        if (sink) {
            sink->write(frame);
        }

        if (cfg_.logging.pipeline_level_logger && cfg_.run.log_every_n_frames > 0
            && frame_index % cfg_.run.log_every_n_frames == 0) {
            const double elapsed = std::chrono::duration<double>(Clock::now() - start).count();
            const double proc_fps = elapsed > 0.0 ? frame_index / elapsed : 0.0;
            const double eta = (proc_fps > 0.0 && total > frame_index) ? (total - frame_index) / proc_fps : 0.0;
            const double pct = total > 0 ? 100.0 * frame_index / total : 0.0;
            std::cout << "[PIPE] Progress: " << std::fixed << std::setprecision(1) << pct
                      << "% | Processing FPS: " << proc_fps
                      << " | ETA: " << eta << "s" << std::defaultfloat << std::endl;
        }
    }

    if (cfg_.logging.pipeline_level_logger) {
        const double elapsed = std::chrono::duration<double>(Clock::now() - start).count();
        std::cout << "[PIPE] done: frames=" << frame_index
                  << " skipped=" << skipped
                  << " records=" << emitter.count()
                  << " tracks=" << store_.next_id() - 1
                  << " in " << std::fixed << std::setprecision(2) << elapsed << "s"
                  << std::defaultfloat << std::endl;
    }
    return emitter.count();
}
