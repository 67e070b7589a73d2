#pragma once
#include <string>
#include <opencv2/videoio.hpp>
#include "io/frame_io.h"
#include "config.h"

// Запись аннотированных кадров через cv::VideoWriter.
// Кодеки перебираются по порядку (mp4v, XVID, MJPG), размер кадра
// ограничивается max_width x max_height и приводится к чётному.
class VideoFileSink : public FrameSink {
public:
    VideoFileSink(std::string path, const OutputConfig &cfg);
    ~VideoFileSink() override;

    void open(const VideoInfo &info) override;
    void write(const cv::Mat &frame) override;
    void close() override;

    // Размер выходного кадра для входного размера.
    static cv::Size output_size(int width, int height, const OutputConfig &cfg);

    const std::string &codec() const { return codec_; }

private:
    std::string path_;
    OutputConfig cfg_;
    cv::VideoWriter writer_;
    cv::Size size_;
    std::string codec_;
};
