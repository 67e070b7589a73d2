#pragma once
#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <string>
#include "io/frame_io.h"
#include "config.h"

// GstFrameSource: последовательное чтение видеофайла через GStreamer.
//   filesrc ! decodebin ! videoconvert ! video/x-raw,format=BGR ! appsink
// В отличие от RTSP-потока кадры не отбрасываются: appsink в pull-режиме,
// следующий кадр забирается только когда цикл обработки готов.
class GstFrameSource : public FrameSource {
public:
    GstFrameSource(std::string path, const VideoConfig &cfg);
    ~GstFrameSource() override;

    void open() override;
    VideoInfo info() const override { return info_; }
    FrameStatus read(cv::Mat &frame) override;
    void close() override;

private:
    bool buildPipeline();
    void teardownPipeline();
    bool readCaps(GstSample *sample);
    void queryTotalFrames();

    // Ошибка на bus -> исключение с текстом GStreamer.
    void throwIfBusError();

    static void onPadAdded(GstElement *src, GstPad *new_pad, gpointer user_data);

    static FrameStatus toMat(GstSample *sample, int width, int height, cv::Mat &out);

private:
    std::string path_;
    VideoConfig cfg_;
    VideoInfo info_;

    GstElement *pipeline_{nullptr};
    GstElement *src_{nullptr};
    GstElement *decode_{nullptr};
    GstElement *convert_{nullptr};
    GstElement *force_caps_{nullptr};
    GstElement *sink_{nullptr};
    GstBus *bus_{nullptr};
};
