#include "plate_fusion.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <opencv2/imgproc.hpp>

/*
  Подготовка кропа к OCR:
    1) увеличение (INTER_CUBIC), пока обе стороны < min_crop_side_px;
    2) серый -> bilateralFilter(11, 17, 17) (шум, края сохраняются);
    3) CLAHE(clip=2.0, 8x8)                 -> вариант "enhanced";
    4) Otsu по enhanced                     -> вариант "binary".
  OCR запускается по обоим вариантам, кандидаты объединяются,
  четырёхугольники переводятся обратно в координаты исходного кропа.
 */

PlateFusion::PlateFusion(TextRecognizer &engine, const PlateConfig &cfg, bool log)
        : engine_(engine), cfg_(cfg), log_(log) {}

int PlateFusion::cadence_for(double speed_kmh) const {
    return speed_kmh < cfg_.slow_speed_kmh ? cfg_.slow_cadence_frames : cfg_.fast_cadence_frames;
}

bool PlateFusion::should_recognize(double speed_kmh, int frame_index) const {
    const int cadence = cadence_for(speed_kmh);
    return cadence > 0 && frame_index % cadence == 0;
}

std::string PlateFusion::normalize_text(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        // только ASCII: UTF-8 байты OCR отбрасываются
        if (c < 0x80 && std::isalnum(c)) {
            out.push_back(ch);
        }
    }
    return out;
}

bool PlateFusion::is_plausible(const std::string &normalized) const {
    if (static_cast<int>(normalized.size()) < cfg_.min_text_length) {
        return false;
    }
    bool has_digit = false;
    bool has_alpha = false;
    for (char ch : normalized) {
        const auto c = static_cast<unsigned char>(ch);
        has_digit = has_digit || std::isdigit(c);
        has_alpha = has_alpha || std::isalpha(c);
    }
    return has_digit && has_alpha;
}

std::optional<PlateRead> PlateFusion::select_best(const std::vector<TextCandidate> &candidates) const {
    std::optional<PlateRead> best;
    for (const auto &c : candidates) {
        if (c.confidence <= cfg_.min_candidate_confidence) {
            continue;
        }
        std::string text = normalize_text(c.text);
        if (!is_plausible(text)) {
            continue;
        }
        if (!best || c.confidence > best->confidence) {
            PlateRead read;
            read.text = std::move(text);
            read.confidence = c.confidence;
            read.quad = c.quad;
            best = std::move(read);
        }
    }
    return best;
}

PlateFusion::Variants PlateFusion::make_variants(const cv::Mat &crop) const {
    Variants v;
    if (crop.empty()) {
        return v;
    }

    cv::Mat work = crop;
    if (crop.rows < cfg_.min_crop_side_px || crop.cols < cfg_.min_crop_side_px) {
        v.scale = std::max(static_cast<double>(cfg_.min_crop_side_px) / crop.rows,
                           static_cast<double>(cfg_.min_crop_side_px) / crop.cols);
        cv::resize(crop, work, cv::Size(), v.scale, v.scale, cv::INTER_CUBIC);
    }

    cv::Mat gray;
    if (work.channels() == 3) {
        cv::cvtColor(work, gray, cv::COLOR_BGR2GRAY);
    } else if (work.channels() == 4) {
        cv::cvtColor(work, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = work.clone();
    }

    cv::Mat bilateral;
    cv::bilateralFilter(gray, bilateral, 11, 17, 17);

    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(2.0, cv::Size(8, 8));
    clahe->apply(bilateral, v.enhanced);

    cv::threshold(v.enhanced, v.binary, 0, 255, cv::THRESH_BINARY + cv::THRESH_OTSU);
    return v;
}

RecognitionResult PlateFusion::run_engine(const cv::Mat &image) {
    try {
        return engine_.recognize(image);
    } catch (const std::exception &e) {
        return RecognitionResult::failure(e.what());
    }
}

RecognitionResult PlateFusion::recognize(const cv::Mat &crop) {
    if (crop.empty()) {
        return RecognitionResult::from_candidates({});
    }

    Variants v;
    try {
        v = make_variants(crop);
    } catch (const cv::Exception &e) {
        return RecognitionResult::failure(std::string("preprocess: ") + e.what());
    }

    std::vector<TextCandidate> merged;
    std::string error;
    for (const cv::Mat *img : {&v.enhanced, &v.binary}) {
        RecognitionResult r = run_engine(*img);
        if (r.status == RecognitionStatus::EngineFailure) {
            error = r.error;
            continue;
        }
        for (auto &c : r.candidates) {
            for (auto &p : c.quad) {
                p.x = static_cast<float>(p.x / v.scale);
                p.y = static_cast<float>(p.y / v.scale);
            }
            merged.push_back(std::move(c));
        }
    }

    if (merged.empty() && !error.empty()) {
        return RecognitionResult::failure(error);
    }
    return RecognitionResult::from_candidates(std::move(merged));
}

void PlateFusion::expire(Track &track) {
    if (track.plate && !track.history.empty()
        && track.plate->frame_index < track.history.front().frame_index) {
        if (log_) {
            std::cout << "[LPR] id=" << track.id << " plate=" << track.plate->text
                      << " expired (read at frame " << track.plate->frame_index << ")" << std::endl;
        }
        track.plate.reset();
    }
}

PlateFusion::Outcome PlateFusion::resolve(Track &track,
                                          double speed_kmh,
                                          int frame_index,
                                          const cv::Mat &crop) {
    Outcome out;
    expire(track);
    if (!should_recognize(speed_kmh, frame_index) || crop.empty()) {
        out.plate = track.plate;
        return out;
    }

    // на кадре с OCR номер только свежий: неудача не подменяется кешем
    out.invoked = true;
    RecognitionResult r = recognize(crop);
    out.status = r.status;

    if (r.status == RecognitionStatus::EngineFailure) {
        std::cerr << "[LPR] id=" << track.id << " frame=" << frame_index
                  << " engine failure: " << r.error << std::endl;
    } else if (r.status == RecognitionStatus::NoCandidate) {
        if (log_) {
            std::cout << "[LPR] id=" << track.id << " frame=" << frame_index
                      << " no text" << std::endl;
        }
    } else {
        std::optional<PlateRead> best = select_best(r.candidates);
        if (best) {
            if (log_) {
                std::cout << "[LPR] id=" << track.id << " frame=" << frame_index
                          << " plate=" << best->text
                          << " conf=" << best->confidence
                          << " (candidates=" << r.candidates.size() << ")" << std::endl;
            }
            best->frame_index = frame_index;
            track.plate = best;
            out.plate = std::move(best);
            out.fresh = true;
        } else if (log_) {
            std::cout << "[LPR] id=" << track.id << " frame=" << frame_index
                      << " " << r.candidates.size() << " candidates rejected" << std::endl;
        }
    }
    return out;
}
