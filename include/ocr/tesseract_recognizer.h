#pragma once
#include <tesseract/baseapi.h>
#include "config.h"
#include "ocr/text_recognizer.h"

// TextRecognizer поверх Tesseract: слова (RIL_WORD) с confidence и рамкой.
class TesseractRecognizer : public TextRecognizer {
public:
    // Init движка; при ошибке бросает std::runtime_error.
    explicit TesseractRecognizer(const OcrConfig &cfg);
    ~TesseractRecognizer() override;

    TesseractRecognizer(const TesseractRecognizer &) = delete;
    TesseractRecognizer &operator=(const TesseractRecognizer &) = delete;

    RecognitionResult recognize(const cv::Mat &image) override;

private:
    OcrConfig cfg_;
    tesseract::TessBaseAPI api_;
};
