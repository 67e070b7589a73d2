#pragma once

#include <opencv2/core.hpp>
#include "track_store.h"

// Привязывает детекцию к треку: ближайший активный трек в пределах
// distance_gate, затем ближайшая dormant-запись (реактивация), иначе новый id.
// Каждая детекция сопоставляется независимо (жадно): две детекции одного
// кадра могут получить один и тот же трек.
class IdentityResolver {
public:
    struct Binding {
        int id = -1;
        enum class Kind { Matched, Revived, Created } kind = Kind::Created;
        float distance_px = 0.0f; // - расстояние до найденного трека (0 для нового).
    };

    IdentityResolver(TrackStore &store, const TrackerConfig &cfg, bool log = false);

    // Возвращает id трека для центра детекции на кадре frame_index.
    int resolve(const cv::Point2f &centroid, int frame_index);

    // То же, но с подробностями сопоставления.
    Binding bind(const cv::Point2f &centroid, int frame_index);

private:
    TrackStore &store_; // - треки текущего прогона.
    float distance_gate_px_ = 50.0f; // - максимальное расстояние для совпадения.
    bool log_ = false;

    bool find_nearest_active(const cv::Point2f &centroid, int &out_id, float &out_dist) const;
    bool find_nearest_dormant(const cv::Point2f &centroid, int &out_id, float &out_dist) const;
};
