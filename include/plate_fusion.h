#pragma once

#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "core/track.h"
#include "ocr/text_recognizer.h"
#include "config.h"

// Чтение номеров с адаптивной частотой.
//  - OCR вызывается раз в slow_cadence_frames кадров для медленных машин
//    и раз в fast_cadence_frames для быстрых;
//  - кандидаты нормализуются до [A-Za-z0-9] и проверяются на "похожесть" на номер;
//  - лучший кандидат кешируется на треке и отдаётся на кадрах без OCR;
//  - на кадре с OCR без принятого кандидата номера нет (кеш не подставляется);
//  - кеш сбрасывается, когда кадр чтения вытеснен из истории трека.
// Последний принятый номер перезаписывает кеш, даже если у старого
// уверенность была выше.
class PlateFusion {
public:
    struct Outcome {
        std::optional<PlateRead> plate; // - номер для этого кадра: свежий при invoked, иначе из кеша.
        bool invoked = false; // - вызывался ли OCR на этом кадре.
        bool fresh = false; // - plate получен на этом кадре.
        RecognitionStatus status = RecognitionStatus::NoCandidate; // - итог вызова (если invoked).
    };

    // Варианты кропа, подаваемые в OCR.
    struct Variants {
        cv::Mat enhanced; // - серый + bilateral + CLAHE.
        cv::Mat binary; // - Otsu по enhanced.
        double scale = 1.0; // - во сколько раз увеличен исходный кроп.
    };

    PlateFusion(TextRecognizer &engine, const PlateConfig &cfg, bool log = false);

    // Раз в сколько кадров вызывать OCR при данной скорости.
    int cadence_for(double speed_kmh) const;
    bool should_recognize(double speed_kmh, int frame_index) const;

    Outcome resolve(Track &track, double speed_kmh, int frame_index, const cv::Mat &crop);

    // Запускает OCR по всем вариантам кропа. Исключения движка -> EngineFailure.
    RecognitionResult recognize(const cv::Mat &crop);

    // Лучший допустимый кандидат.
    std::optional<PlateRead> select_best(const std::vector<TextCandidate> &candidates) const;

    bool is_plausible(const std::string &normalized) const;

    static std::string normalize_text(const std::string &text);
    Variants make_variants(const cv::Mat &crop) const;

private:
    TextRecognizer &engine_;
    PlateConfig cfg_;
    bool log_ = false;

    RecognitionResult run_engine(const cv::Mat &image);
    void expire(Track &track);
};
