#include "ocr/tesseract_recognizer.h"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

TesseractRecognizer::TesseractRecognizer(const OcrConfig &cfg)
        : cfg_(cfg) {
    const char *datapath = cfg_.tessdata_path.empty() ? nullptr : cfg_.tessdata_path.c_str();
    if (api_.Init(datapath, cfg_.language.c_str()) != 0) {
        throw std::runtime_error("tesseract init failed (lang=" + cfg_.language + ")");
    }
    api_.SetVariable("debug_file", "/dev/null");
    if (!cfg_.char_whitelist.empty()) {
        api_.SetVariable("tessedit_char_whitelist", cfg_.char_whitelist.c_str());
    }
    api_.SetPageSegMode(static_cast<tesseract::PageSegMode>(cfg_.page_seg_mode));

    std::cout << "[OCR] tesseract " << api_.Version() << " ready, lang=" << cfg_.language << std::endl;
}

TesseractRecognizer::~TesseractRecognizer() {
    api_.End();
}

RecognitionResult TesseractRecognizer::recognize(const cv::Mat &image) {
    if (image.empty()) {
        return RecognitionResult::from_candidates({});
    }

    // Tesseract ждёт 8-битный непрерывный буфер; BGR -> gray.
    cv::Mat work;
    if (image.channels() == 3) {
        cv::cvtColor(image, work, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 1) {
        work = image.isContinuous() ? image : image.clone();
    } else {
        return RecognitionResult::failure("unsupported image channels: " + std::to_string(image.channels()));
    }

    api_.SetImage(work.data, work.cols, work.rows, work.channels(), static_cast<int>(work.step1()));
    if (api_.Recognize(nullptr) != 0) {
        api_.Clear();
        return RecognitionResult::failure("tesseract recognize failed");
    }

    std::vector<TextCandidate> out;
    std::unique_ptr<tesseract::ResultIterator> ri(api_.GetIterator());
    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
    if (ri) {
        do {
            if (ri->Empty(level)) continue;

            std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
            if (!word || word[0] == '\0') continue;

            int x1 = 0, y1 = 0, x2 = 0, y2 = 0;
            if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2)) continue;

            TextCandidate c;
            c.text = word.get();
            c.confidence = ri->Confidence(level) / 100.0;
            c.quad = {cv::Point2f(static_cast<float>(x1), static_cast<float>(y1)),
                      cv::Point2f(static_cast<float>(x2), static_cast<float>(y1)),
                      cv::Point2f(static_cast<float>(x2), static_cast<float>(y2)),
                      cv::Point2f(static_cast<float>(x1), static_cast<float>(y2))};
            out.push_back(std::move(c));
        } while (ri->Next(level));
    }

    api_.Clear();
    return RecognitionResult::from_candidates(std::move(out));
}
