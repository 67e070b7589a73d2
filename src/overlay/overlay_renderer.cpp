#include "overlay/overlay_renderer.h"

#include <algorithm>
#include <cstdio>
#include <opencv2/imgproc.hpp>

namespace {
const cv::Scalar COLOR_OK(0, 255, 0);          // green
const cv::Scalar COLOR_OVERSPEED(0, 0, 255);   // red
const cv::Scalar COLOR_PLATE(255, 255, 0);     // cyan (BGR)
const cv::Scalar COLOR_ZONE(0, 0, 255);
const cv::Scalar COLOR_INFO(255, 255, 255);
}

//------------------------------------------------------------------------------
// ctor
//------------------------------------------------------------------------------
OverlayRenderer::OverlayRenderer(const OverlayConfig& cfg)
        : cfg_(cfg) {}

//------------------------------------------------------------------------------
// Utility helpers
//------------------------------------------------------------------------------
cv::Rect OverlayRenderer::clip_rect(const cv::Rect& r, int w, int h) {
    int x1 = std::max(0, r.x);
    int y1 = std::max(0, r.y);
    int x2 = std::min(w, r.x + r.width);
    int y2 = std::min(h, r.y + r.height);

    if (x2 <= x1 || y2 <= y1)
        return cv::Rect(0, 0, 0, 0);

    return cv::Rect(x1, y1, x2 - x1, y2 - y1);
}

void OverlayRenderer::draw_label(
        cv::Mat& frame,
        const cv::Point& org,
        const std::string& text,
        const cv::Scalar& color,
        double scale
) const {
    cv::putText(
            frame, text, org,
            cv::FONT_HERSHEY_SIMPLEX, scale,
            color, 2, cv::LINE_AA
    );
}

//------------------------------------------------------------------------------
// Машина: рамка, ID, скорость в зоне, номер
//------------------------------------------------------------------------------
void OverlayRenderer::draw_vehicle(cv::Mat& frame, const VehicleAnnotation& v) const {
    if (!cfg_.enabled || frame.empty())
        return;

    const cv::Rect r = clip_rect(cv::Rect(v.bbox), frame.cols, frame.rows);
    if (r.width <= 0 || r.height <= 0)
        return;

    const cv::Scalar color = v.is_overspeed ? COLOR_OVERSPEED : COLOR_OK;
    cv::rectangle(frame, r, color, v.is_overspeed ? 3 : 2);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "ID:%d", v.vehicle_id);
    draw_label(frame, cv::Point(r.x, std::max(14, r.y - 10)), buf, color, cfg_.font_scale + 0.1);

    // скорость показываем только внутри зоны измерения
    if (v.in_zone) {
        std::snprintf(buf, sizeof(buf), "%.1f km/h%s", v.speed_kmh, v.is_overspeed ? " OVERSPEED" : "");
        draw_label(frame, cv::Point(r.x, r.y + 20), buf, color, cfg_.font_scale);
    }

    if (v.plate) {
        draw_label(frame, cv::Point(r.x, r.y + r.height + 20), "LP: " + v.plate->text, COLOR_PLATE, cfg_.font_scale);

        // quad задан относительно кропа машины
        const cv::Point tl(r.x + static_cast<int>(v.plate->quad[0].x), r.y + static_cast<int>(v.plate->quad[0].y));
        const cv::Point br(r.x + static_cast<int>(v.plate->quad[2].x), r.y + static_cast<int>(v.plate->quad[2].y));
        const cv::Rect lp = clip_rect(cv::Rect(tl, br), frame.cols, frame.rows);
        if (lp.width > 0 && lp.height > 0)
            cv::rectangle(frame, lp, COLOR_PLATE, 2);
    }
}

//------------------------------------------------------------------------------
// Зона и информация о кадре
//------------------------------------------------------------------------------
void OverlayRenderer::draw_frame_info(
        cv::Mat& frame,
        const SpeedZone& zone,
        int frame_index,
        int total_frames,
        std::size_t vehicles
) const {
    if (!cfg_.enabled || frame.empty())
        return;

    if (cfg_.draw_zone) {
        cv::line(frame, cv::Point(0, zone.top()), cv::Point(frame.cols, zone.top()), COLOR_ZONE, 2);
        cv::line(frame, cv::Point(0, zone.bottom()), cv::Point(frame.cols, zone.bottom()), COLOR_ZONE, 2);
        draw_label(frame, cv::Point(10, std::max(14, zone.top() - 10)), "Speed Detection Zone", COLOR_ZONE, cfg_.font_scale + 0.1);
    }

    if (cfg_.draw_frame_info) {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "Frame: %d/%d | Vehicles: %zu", frame_index, total_frames, vehicles);
        draw_label(frame, cv::Point(10, 30), buf, COLOR_INFO, cfg_.font_scale + 0.1);
    }
}
