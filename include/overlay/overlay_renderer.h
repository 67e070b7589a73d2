#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string>

#include "core/track.h"
#include "speed_zone.h"
#include "config.h"

//------------------------------------------------------------------------------
// OverlayRenderer
//
// Рисует на выходных кадрах:
//  - bbox машины (красный при превышении, иначе зелёный) и ID;
//  - скорость (только внутри зоны);
//  - номер и его четырёхугольник, если номер известен;
//  - границы зоны и строку с номером кадра.
//
// Только отображение: состояние трекера не меняется.
//------------------------------------------------------------------------------
class OverlayRenderer {
public:
    struct VehicleAnnotation {
        cv::Rect2f bbox;
        int vehicle_id = -1;
        double speed_kmh = 0.0;
        bool in_zone = false;
        bool is_overspeed = false;
        std::optional<PlateRead> plate;
    };

    explicit OverlayRenderer(const OverlayConfig& cfg);

    void draw_vehicle(cv::Mat& frame, const VehicleAnnotation& v) const;

    // Границы зоны + "Frame: N/T | Vehicles: K".
    void draw_frame_info(
            cv::Mat& frame,
            const SpeedZone& zone,
            int frame_index,
            int total_frames,
            std::size_t vehicles
    ) const;

    bool enabled() const { return cfg_.enabled; }

private:
    OverlayConfig cfg_;

    static cv::Rect clip_rect(const cv::Rect& r, int w, int h);

    void draw_label(
            cv::Mat& frame,
            const cv::Point& org,
            const std::string& text,
            const cv::Scalar& color,
            double scale
    ) const;
};
