#include "io/gst_frame_source.h"

#include <cmath>
#include <cstring>
#include <iostream>
#include <stdexcept>

GstFrameSource::GstFrameSource(std::string path, const VideoConfig &cfg)
        : path_(std::move(path)), cfg_(cfg) {}

GstFrameSource::~GstFrameSource() {
    close();
}

void GstFrameSource::open() {
    if (!gst_is_initialized()) {
        gst_init(nullptr, nullptr);
    }

    if (!buildPipeline()) {
        teardownPipeline();
        throw std::runtime_error("cannot build decode pipeline for " + path_);
    }

    // PAUSED -> preroll: первый кадр даёт caps (размер, fps).
    if (gst_element_set_state(pipeline_, GST_STATE_PAUSED) == GST_STATE_CHANGE_FAILURE) {
        teardownPipeline();
        throw std::runtime_error("cannot open video: " + path_);
    }

    // preroll-буфер appsink отдаст ещё раз через pull_sample в PLAYING,
    // здесь он нужен только ради caps.
    GstSample *preroll = gst_app_sink_try_pull_preroll(GST_APP_SINK(sink_),
                                                       (GstClockTime)cfg_.pull_timeout_ms * GST_MSECOND);
    if (!preroll) {
        try {
            throwIfBusError();
        } catch (...) {
            teardownPipeline();
            throw;
        }
        teardownPipeline();
        throw std::runtime_error("no video frames in " + path_);
    }
    const bool caps_ok = readCaps(preroll);
    gst_sample_unref(preroll);
    if (!caps_ok) {
        teardownPipeline();
        throw std::runtime_error("unsupported video caps in " + path_);
    }
    queryTotalFrames();

    if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
        teardownPipeline();
        throw std::runtime_error("cannot start video: " + path_);
    }

    if (cfg_.verbose) {
        std::cout << "[VIDEO] " << path_ << ": " << info_.total_frames << " frames at "
                  << info_.fps << " FPS, " << info_.width << "x" << info_.height << std::endl;
    }
}

bool GstFrameSource::buildPipeline() {
    teardownPipeline();

    // decodebin даёт динамический src pad -> подключаем в onPadAdded().
    pipeline_   = gst_pipeline_new("file-pipeline");
    src_        = gst_element_factory_make("filesrc", "src");
    decode_     = gst_element_factory_make(cfg_.decoder.c_str(), "decode");
    convert_    = gst_element_factory_make("videoconvert", "convert");
    force_caps_ = gst_element_factory_make("capsfilter", "force_caps");
    sink_       = gst_element_factory_make("appsink", "sink");

    if (!pipeline_ || !src_ || !decode_ || !convert_ || !force_caps_ || !sink_) {
        std::cerr << "[VIDEO] failed to create one or more GStreamer elements" << std::endl;
        // элементы, не попавшие в bin, освобождаем сами
        for (GstElement *e : {src_, decode_, convert_, force_caps_, sink_}) {
            if (e) gst_object_unref(e);
        }
        src_ = decode_ = convert_ = force_caps_ = sink_ = nullptr;
        return false;
    }

    g_object_set(G_OBJECT(src_), "location", path_.c_str(), nullptr);

    GstCaps *caps = gst_caps_from_string("video/x-raw,format=BGR");
    g_object_set(G_OBJECT(force_caps_), "caps", caps, nullptr);
    gst_caps_unref(caps);

    // appsink: без синхронизации по часам и без выбрасывания кадров.
    g_object_set(G_OBJECT(sink_), "emit-signals", FALSE, nullptr);
    g_object_set(G_OBJECT(sink_), "sync", FALSE, nullptr);
    g_object_set(G_OBJECT(sink_), "max-buffers", 4, nullptr);
    g_object_set(G_OBJECT(sink_), "drop", FALSE, nullptr);

    g_signal_connect(decode_, "pad-added", G_CALLBACK(&GstFrameSource::onPadAdded), this);

    gst_bin_add_many(GST_BIN(pipeline_), src_, decode_, convert_, force_caps_, sink_, nullptr);

    if (!gst_element_link(src_, decode_)) {
        std::cerr << "[VIDEO] failed to link filesrc->decode" << std::endl;
        return false;
    }
    if (!gst_element_link_many(convert_, force_caps_, sink_, nullptr)) {
        std::cerr << "[VIDEO] failed to link convert->caps->sink" << std::endl;
        return false;
    }

    bus_ = gst_element_get_bus(pipeline_);
    return true;
}

void GstFrameSource::teardownPipeline() {
    if (bus_) {
        gst_object_unref(bus_);
        bus_ = nullptr;
    }
    if (!pipeline_) {
        return;
    }

    gst_element_set_state(pipeline_, GST_STATE_NULL);
    GstState cur = GST_STATE_NULL, pending = GST_STATE_NULL;
    gst_element_get_state(pipeline_, &cur, &pending, 2 * GST_SECOND);

    // unref pipeline освобождает всё дерево элементов.
    gst_object_unref(pipeline_);
    pipeline_ = nullptr;
    src_ = decode_ = convert_ = force_caps_ = sink_ = nullptr;
}

bool GstFrameSource::readCaps(GstSample *sample) {
    GstCaps *caps = gst_sample_get_caps(sample);
    if (!caps) return false;

    GstStructure *s = gst_caps_get_structure(caps, 0);
    int width = 0, height = 0;
    if (!gst_structure_get_int(s, "width", &width) || !gst_structure_get_int(s, "height", &height)) {
        return false;
    }
    int fps_n = 0, fps_d = 1;
    if (gst_structure_get_fraction(s, "framerate", &fps_n, &fps_d) && fps_d > 0) {
        info_.fps = static_cast<double>(fps_n) / fps_d;
    }
    info_.width = width;
    info_.height = height;
    return width > 0 && height > 0;
}

void GstFrameSource::queryTotalFrames() {
    gint64 frames = 0;
    if (gst_element_query_duration(pipeline_, GST_FORMAT_DEFAULT, &frames) && frames > 0) {
        info_.total_frames = static_cast<int>(frames);
        return;
    }
    gint64 duration_ns = 0;
    if (info_.fps > 0.0 && gst_element_query_duration(pipeline_, GST_FORMAT_TIME, &duration_ns) && duration_ns > 0) {
        info_.total_frames = static_cast<int>(std::llround(duration_ns / 1e9 * info_.fps));
    }
}

void GstFrameSource::throwIfBusError() {
    if (!bus_) return;
    GstMessage *msg = gst_bus_pop_filtered(bus_, GST_MESSAGE_ERROR);
    if (!msg) return;

    GError *err = nullptr;
    gchar *dbg = nullptr;
    gst_message_parse_error(msg, &err, &dbg);
    std::string text = err ? err->message : "(null)";
    if (cfg_.verbose && dbg) {
        std::cerr << "[VIDEO] debug: " << dbg << std::endl;
    }
    if (err) g_error_free(err);
    if (dbg) g_free(dbg);
    gst_message_unref(msg);
    throw std::runtime_error("video read error: " + text);
}

FrameStatus GstFrameSource::toMat(GstSample *sample, int width, int height, cv::Mat &out) {
    GstBuffer *buffer = gst_sample_get_buffer(sample);
    if (!buffer) return FrameStatus::Skipped;

    GstMapInfo map{};
    if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) {
        return FrameStatus::Skipped;
    }

    // BGR: строки могут быть выровнены, шаг берём из размера буфера.
    const size_t step = height > 0 ? map.size / static_cast<size_t>(height) : 0;
    FrameStatus st = FrameStatus::Skipped;
    if (step >= static_cast<size_t>(width) * 3) {
        cv::Mat view(height, width, CV_8UC3, (void *)map.data, step);
        out = view.clone();
        st = FrameStatus::Ok;
    }

    gst_buffer_unmap(buffer, &map);
    return st;
}

FrameStatus GstFrameSource::read(cv::Mat &frame) {
    if (!pipeline_ || !sink_) {
        return FrameStatus::End;
    }

    GstSample *sample = gst_app_sink_try_pull_sample(GST_APP_SINK(sink_),
                                                     (GstClockTime)cfg_.pull_timeout_ms * GST_MSECOND);
    if (!sample) {
        if (gst_app_sink_is_eos(GST_APP_SINK(sink_))) {
            return FrameStatus::End;
        }
        throwIfBusError();
        throw std::runtime_error("no frame within " + std::to_string(cfg_.pull_timeout_ms) + " ms: " + path_);
    }

    const FrameStatus st = toMat(sample, info_.width, info_.height, frame);
    gst_sample_unref(sample);
    return st;
}

void GstFrameSource::close() {
    teardownPipeline();
}

void GstFrameSource::onPadAdded(GstElement * /*src*/, GstPad *new_pad, gpointer user_data) {
    auto *self = static_cast<GstFrameSource *>(user_data);
    if (!self || !self->convert_) return;

    GstCaps *caps = gst_pad_get_current_caps(new_pad);
    if (!caps) caps = gst_pad_query_caps(new_pad, nullptr);
    if (!caps) return;

    // Важно: берём только видео, аудио-дорожку игнорируем.
    GstStructure *str = gst_caps_get_structure(caps, 0);
    const char *name = gst_structure_get_name(str);
    if (!name || std::strncmp(name, "video/", 6) != 0) {
        gst_caps_unref(caps);
        return;
    }

    GstPad *sinkpad = gst_element_get_static_pad(self->convert_, "sink");
    if (!sinkpad) {
        gst_caps_unref(caps);
        return;
    }

    if (!gst_pad_is_linked(sinkpad)) {
        GstPadLinkReturn ret = gst_pad_link(new_pad, sinkpad);
        if (self->cfg_.verbose) {
            std::cerr << "[VIDEO] [pad-added] " << name << " link result = " << ret << std::endl;
        }
    }

    gst_object_unref(sinkpad);
    gst_caps_unref(caps);
}
