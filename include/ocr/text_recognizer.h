#pragma once
#include <array>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

// Кандидат текста от OCR. quad в координатах переданного изображения.
struct TextCandidate {
    std::string text;
    double confidence = 0.0; // - [0..1]
    std::array<cv::Point2f, 4> quad{}; // - TL, TR, BR, BL.
};

enum class RecognitionStatus {
    Ok,             // есть хотя бы один кандидат
    NoCandidate,    // движок отработал, текста нет
    EngineFailure   // движок упал; error содержит причину
};

struct RecognitionResult {
    RecognitionStatus status = RecognitionStatus::NoCandidate;
    std::vector<TextCandidate> candidates;
    std::string error;

    static RecognitionResult from_candidates(std::vector<TextCandidate> candidates) {
        RecognitionResult r;
        r.status = candidates.empty() ? RecognitionStatus::NoCandidate : RecognitionStatus::Ok;
        r.candidates = std::move(candidates);
        return r;
    }

    static RecognitionResult failure(std::string error) {
        RecognitionResult r;
        r.status = RecognitionStatus::EngineFailure;
        r.error = std::move(error);
        return r;
    }
};

// Внешний движок распознавания текста.
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;

    virtual RecognitionResult recognize(const cv::Mat &image) = 0;
};
