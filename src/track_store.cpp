#include "track_store.h"
#include <iostream>
#include <stdexcept>
#include <string>

/*
  хранилище треков: активные треки + dormant-записи.
  Старение:
    frame - last_seen_frame > max_age_frames        -> active  => dormant (история выбрасывается)
    frame - demoted_frame > dormant_max_age_frames  -> dormant => забыт (id больше не выдаётся)
 */

TrackStore::TrackStore(const TrackerConfig &cfg, bool log)
        : cfg_(cfg), log_(log) {}

void TrackStore::reset() {
    active_.clear();
    dormant_.clear();
    next_id_ = 1;
}

void TrackStore::age_out(int frame_index) {
    for (auto it = active_.begin(); it != active_.end();) {
        const Track &t = it->second;
        if (frame_index - t.last_seen_frame <= cfg_.max_age_frames) {
            ++it;
            continue;
        }
        // трек без единой позиции восстановить не по чему
        if (t.has_position()) {
            DormantTrack d;
            d.id = t.id;
            d.last_position = t.last_position();
            d.demoted_frame = frame_index;
            dormant_[t.id] = d;
            if (log_) {
                std::cout << "[TRK] id=" << t.id << " -> dormant at frame " << frame_index
                          << " last=(" << d.last_position.x << "," << d.last_position.y << ")"
                          << std::endl;
            }
        }
        it = active_.erase(it);
    }

    if (cfg_.dormant_max_age_frames <= 0) {
        return;
    }
    for (auto it = dormant_.begin(); it != dormant_.end();) {
        if (frame_index - it->second.demoted_frame > cfg_.dormant_max_age_frames) {
            if (log_) {
                std::cout << "[TRK] id=" << it->first << " forgotten at frame " << frame_index << std::endl;
            }
            it = dormant_.erase(it);
        } else {
            ++it;
        }
    }
}

Track &TrackStore::create(int frame_index) {
    Track t;
    t.id = next_id_++;
    t.last_seen_frame = frame_index;
    if (log_) {
        std::cout << "[TRK] new id=" << t.id << " at frame " << frame_index << std::endl;
    }
    auto res = active_.emplace(t.id, std::move(t));
    return res.first->second;
}

Track &TrackStore::revive(int id, int frame_index) {
    auto it = dormant_.find(id);
    if (it == dormant_.end()) {
        throw std::logic_error("revive: id " + std::to_string(id) + " is not dormant");
    }
    dormant_.erase(it);

    Track t;
    t.id = id;
    t.last_seen_frame = frame_index;
    if (log_) {
        std::cout << "[TRK] revived id=" << id << " at frame " << frame_index << std::endl;
    }
    auto res = active_.emplace(id, std::move(t));
    return res.first->second;
}

void TrackStore::touch(int id, int frame_index) {
    auto it = active_.find(id);
    if (it != active_.end()) {
        it->second.last_seen_frame = frame_index;
    }
}

Track *TrackStore::find(int id) {
    auto it = active_.find(id);
    return it == active_.end() ? nullptr : &it->second;
}

const Track *TrackStore::find(int id) const {
    auto it = active_.find(id);
    return it == active_.end() ? nullptr : &it->second;
}
