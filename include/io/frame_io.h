#pragma once
#include <opencv2/core.hpp>

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    int total_frames = 0; // - 0, если длина неизвестна.
};

enum class FrameStatus {
    Ok,       // кадр прочитан
    Skipped,  // кадр повреждён/не прочитан, поток продолжается
    End       // конец потока
};

// Источник декодированных кадров (BGR).
class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Бросает std::runtime_error, если поток нельзя открыть.
    virtual void open() = 0;
    virtual VideoInfo info() const = 0;
    virtual FrameStatus read(cv::Mat &frame) = 0;
    virtual void close() = 0;
};

// Приёмник аннотированных кадров.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Бросает std::runtime_error, если запись невозможна.
    virtual void open(const VideoInfo &info) = 0;
    virtual void write(const cv::Mat &frame) = 0;
    virtual void close() = 0;
};
