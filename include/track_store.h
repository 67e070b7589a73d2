#pragma once

#include <map>
#include <opencv2/core.hpp>
#include "core/track.h"
#include "config.h"

// Хранилище треков одного прогона: активные треки (с историей) и
// dormant-записи (только последний центр), старение по номеру кадра.
class TrackStore {
public:
    struct DormantTrack {
        int id = -1; // - идентификатор исходного трека.
        cv::Point2f last_position{0.0f, 0.0f}; // - последний известный центр.
        int demoted_frame = 0; // - кадр, на котором трек стал dormant.
    };

    explicit TrackStore(const TrackerConfig &cfg, bool log = false);

    // Сбрасывает все треки и счётчик id.
    void reset();

    // Раз в кадр: активные треки, не виденные дольше max_age_frames,
    // переходят в dormant; слишком старые dormant-записи забываются.
    void age_out(int frame_index);

    // Создаёт новый активный трек с новым id.
    Track &create(int frame_index);

    // Возвращает dormant-трек в активные под тем же id, с пустой историей.
    Track &revive(int id, int frame_index);

    // Обновляет last_seen_frame активного трека.
    void touch(int id, int frame_index);

    Track *find(int id);
    const Track *find(int id) const;

    bool is_active(int id) const { return active_.count(id) != 0; }
    bool is_dormant(int id) const { return dormant_.count(id) != 0; }

    const std::map<int, Track> &active() const { return active_; }
    const std::map<int, DormantTrack> &dormant() const { return dormant_; }

    int next_id() const { return next_id_; }
    const TrackerConfig &config() const { return cfg_; }

private:
    TrackerConfig cfg_; // - параметры старения.
    bool log_ = false; // - писать [TRK] сообщения.
    int next_id_ = 1; // - счётчик id для новых треков.
    std::map<int, Track> active_; // - активные треки, упорядочены по id.
    std::map<int, DormantTrack> dormant_; // - недавно потерянные треки.
};
