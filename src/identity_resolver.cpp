#include "identity_resolver.h"
#include "util/geometry.h"

#include <iostream>
#include <limits>

/*
    Порядок поиска трека для детекции:
    1) find_nearest_active(...)
       - перебирает активные треки (по возрастанию id), берёт последнюю позицию истории;
       - выбирает минимальное расстояние, строго меньше distance_gate_px_.
    2) find_nearest_dormant(...)
       - то же по последним центрам dormant-записей; найденный трек реактивируется
         под тем же id, история начинается заново.
    3) иначе создаётся новый трек.
*/

IdentityResolver::IdentityResolver(TrackStore &store, const TrackerConfig &cfg, bool log)
        : store_(store), distance_gate_px_(cfg.distance_gate_px), log_(log) {}

bool IdentityResolver::find_nearest_active(const cv::Point2f &centroid,
                                           int &out_id,
                                           float &out_dist) const {
    float best_dist = std::numeric_limits<float>::max();
    bool found = false;
    for (const auto &entry : store_.active()) {
        const Track &t = entry.second;
        // трек, созданный на этом кадре, ещё без позиции
        if (!t.has_position()) {
            continue;
        }
        const float dist = util::distance(centroid, t.last_position());
        if (dist < distance_gate_px_ && dist < best_dist) {
            best_dist = dist;
            out_id = t.id;
            found = true;
        }
    }
    out_dist = best_dist;
    return found;
}

bool IdentityResolver::find_nearest_dormant(const cv::Point2f &centroid,
                                            int &out_id,
                                            float &out_dist) const {
    float best_dist = std::numeric_limits<float>::max();
    bool found = false;
    for (const auto &entry : store_.dormant()) {
        const float dist = util::distance(centroid, entry.second.last_position);
        if (dist < distance_gate_px_ && dist < best_dist) {
            best_dist = dist;
            out_id = entry.first;
            found = true;
        }
    }
    out_dist = best_dist;
    return found;
}

IdentityResolver::Binding IdentityResolver::bind(const cv::Point2f &centroid, int frame_index) {
    Binding b;
    int id = -1;
    float dist = 0.0f;

    if (find_nearest_active(centroid, id, dist)) {
        store_.touch(id, frame_index);
        b.id = id;
        b.kind = Binding::Kind::Matched;
        b.distance_px = dist;
    } else if (find_nearest_dormant(centroid, id, dist)) {
        store_.revive(id, frame_index);
        b.id = id;
        b.kind = Binding::Kind::Revived;
        b.distance_px = dist;
    } else {
        b.id = store_.create(frame_index).id;
        b.kind = Binding::Kind::Created;
    }

    if (log_) {
        const char *kind = b.kind == Binding::Kind::Matched ? "matched"
                         : b.kind == Binding::Kind::Revived ? "revived" : "created";
        std::cout << "[TRK] frame=" << frame_index
                  << " c=(" << centroid.x << "," << centroid.y << ")"
                  << " -> id=" << b.id << " " << kind
                  << " dist=" << b.distance_px << std::endl;
    }
    return b;
}

int IdentityResolver::resolve(const cv::Point2f &centroid, int frame_index) {
    return bind(centroid, frame_index).id;
}
