#pragma once

#include <opencv2/core.hpp>
#include <vector>

#include "config.h"
#include "calibration.h"
#include "track_store.h"
#include "identity_resolver.h"
#include "speed_estimator.h"
#include "plate_fusion.h"
#include "speed_zone.h"
#include "record_emitter.h"
#include "detect/detection.h"
#include "io/frame_io.h"
#include "overlay/overlay_renderer.h"

// Покадровый цикл одного видео. Строго последовательный: изменения треков
// кадра N применяются полностью до чтения кадра N+1.
//
//   детекции -> фильтр машин -> старение треков -> IdentityResolver
//            -> SpeedEstimator -> PlateFusion -> зона/превышение
//            -> overlay -> RecordEmitter -> прогресс
class SpeedPipeline {
public:
    SpeedPipeline(ObjectDetector &detector, TextRecognizer &recognizer, const AppConfig &cfg);

    // Готовит состояние под новое видео: калибровка, зона, fps, пустые треки.
    void begin(const VideoInfo &info);

    // Обрабатывает один кадр (номер с 1), рисует overlay на frame.
    // Возвращает число детекций машин на кадре.
    std::size_t process_frame(cv::Mat &frame, int frame_index, RecordEmitter &emitter);

    // Полный цикл по уже открытым source/sink. Возвращает число записей.
    std::size_t process(FrameSource &source, FrameSink *sink, RecordEmitter &emitter);

    const TrackStore &store() const { return store_; }
    const Calibration &calibration() const { return calibration_; }
    const SpeedZone &zone() const { return zone_; }
    double fps() const { return fps_; }

private:
    ObjectDetector &detector_;
    AppConfig cfg_;

    TrackStore store_; // - треки этого прогона (только рабочий поток).
    IdentityResolver resolver_;
    SpeedEstimator estimator_;
    PlateFusion plates_;
    OverlayRenderer overlay_;

    VideoInfo info_;
    Calibration calibration_;
    SpeedZone zone_;
    double fps_ = 30.0;

    std::vector<Detection> detect(const cv::Mat &frame, int frame_index);
};
