#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <stdexcept>
#include <vector>
#include <toml++/toml.h>   // ОБЯЗАТЕЛЬНО, forward-decl НЕЛЬЗЯ


template <typename T>
static T read_required(const toml::table &tbl, std::string_view key) {
    const auto *node = tbl.get(key);
    if (!node) {
        throw std::runtime_error("missing key " + std::string(key));
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value for " + std::string(key));
    }
    return *value;
}

// Читает ключ, если он есть. Отсутствующий ключ оставляет дефолт,
// ключ неверного типа -> исключение (ловится в load_*_config).
template <typename T>
static void read_optional(const toml::table &tbl, std::string_view key, T &out) {
    const auto *node = tbl.get(key);
    if (!node) {
        return;
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value for " + std::string(key));
    }
    out = *value;
}


// ----------------------------- [tracker] ------------------------------
struct TrackerConfig {
    float distance_gate_px = 50.0f; // - максимальное расстояние центр-центр для "той же" машины.
    int max_age_frames = 30; // - сколько кадров активный трек может не обновляться до перевода в dormant.
    int dormant_max_age_frames = 300; // - сколько кадров хранится dormant-запись (0 = без ограничения).
};

// ------------------------------ [speed] -------------------------------
struct SpeedConfig {
    int min_samples = 3; // - минимум точек истории для оценки скорости.
    int max_intervals = 5; // - сколько последних интервалов усредняем.
    double correction_factor = 1.2; // - эмпирический поправочный коэффициент.
    double max_plausible_kmh = 200.0; // - мгновенные значения вне (0, max) отбрасываются.
    double min_displacement_px = 1.0; // - смещения меньше этого считаем шумом.
    double smoothing_alpha = 0.3; // - вес нового значения в экспоненциальном сглаживании.
};

// --------------------------- [calibration] ----------------------------
struct CalibrationConfig {
    double road_width_fraction = 0.6; // - доля ширины кадра, занятая дорогой.
    int lanes = 2; // - предполагаемое число полос.
    double lane_width_m = 3.5; // - ширина полосы (метры).
    double min_pixels_per_meter = 5.0;
    double max_pixels_per_meter = 8.0;
    double fixed_pixels_per_meter = 0.0; // - если > 0, используется как есть.
};

// ------------------------------- [zone] -------------------------------
struct ZoneConfig {
    double top_fraction = 0.4; // - верхняя граница зоны (доля высоты кадра).
    double bottom_fraction = 0.7; // - нижняя граница зоны (доля высоты кадра).
    double speed_limit_kmh = 80.0; // - порог превышения скорости.
};

// ------------------------------ [plate] -------------------------------
struct PlateConfig {
    double slow_speed_kmh = 40.0; // - ниже этой скорости OCR запускается чаще.
    int slow_cadence_frames = 5;
    int fast_cadence_frames = 10;
    double min_candidate_confidence = 0.4; // - кандидаты с меньшей уверенностью отбрасываются.
    int min_text_length = 4;
    int min_crop_side_px = 100; // - кроп увеличивается, пока обе стороны не станут >= этого.
};

// ------------------------------ [intake] ------------------------------
struct IntakeConfig {
    std::vector<int> vehicle_classes{2, 3, 5, 7}; // - COCO: car, motorcycle, bus, truck.
    float min_confidence = 0.5f;
};

// ----------------------------- [overlay] ------------------------------
struct OverlayConfig {
    bool enabled = true;
    double font_scale = 0.6;
    bool draw_zone = true;
    bool draw_frame_info = true;
};

// ------------------------------ [output] ------------------------------
struct OutputConfig {
    std::vector<std::string> codecs{"mp4v", "XVID", "MJPG"}; // - перебираются по порядку.
    int max_width = 1920;
    int max_height = 1080;
    char csv_separator = ',';
};

// ----------------------------- [detector] -----------------------------
struct DetectorConfig {
    std::string rknn_model_path;
    float rknn_scale = 1.0f / 255.0f;
    bool rknn_swap_rb = true;
    float rknn_conf_threshold = 0.35f;
    float rknn_nms_threshold = 0.45f;
};

// ------------------------------- [ocr] --------------------------------
struct OcrConfig {
    std::string tessdata_path; // - пусто = путь по умолчанию tesseract.
    std::string language = "eng";
    std::string char_whitelist = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    int page_seg_mode = 11; // - PSM_SPARSE_TEXT
};

// ------------------------------ [video] -------------------------------
struct VideoConfig {
    std::string decoder = "decodebin";
    int pull_timeout_ms = 5000; // - таймаут ожидания одного кадра из appsink.
    bool verbose = true;
};

// ------------------------------- [run] --------------------------------
struct RunConfig {
    int log_every_n_frames = 100;
    int poll_interval_ms = 500; // - период опроса прогресса в CLI.
};

struct LoggingConfig {
    bool tracker_level_logger = false;
    bool speed_level_logger = false;
    bool plate_level_logger = true;
    bool pipeline_level_logger = true;
    bool detector_level_logger = false;
};

bool load_tracker_config(const toml::table &tbl, TrackerConfig &cfg);
bool load_speed_config(const toml::table &tbl, SpeedConfig &cfg);
bool load_calibration_config(const toml::table &tbl, CalibrationConfig &cfg);
bool load_zone_config(const toml::table &tbl, ZoneConfig &cfg);
bool load_plate_config(const toml::table &tbl, PlateConfig &cfg);
bool load_intake_config(const toml::table &tbl, IntakeConfig &cfg);
bool load_overlay_config(const toml::table &tbl, OverlayConfig &cfg);
bool load_output_config(const toml::table &tbl, OutputConfig &cfg);
bool load_detector_config(const toml::table &tbl, DetectorConfig &cfg);
bool load_ocr_config(const toml::table &tbl, OcrConfig &cfg);
bool load_video_config(const toml::table &tbl, VideoConfig &cfg);
bool load_run_config(const toml::table &tbl, RunConfig &cfg);
bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg);

// Полная конфигурация приложения (все таблицы config.toml).
struct AppConfig {
    TrackerConfig tracker;
    SpeedConfig speed;
    CalibrationConfig calibration;
    ZoneConfig zone;
    PlateConfig plate;
    IntakeConfig intake;
    OverlayConfig overlay;
    OutputConfig output;
    DetectorConfig detector;
    OcrConfig ocr;
    VideoConfig video;
    RunConfig run;
    LoggingConfig logging;
};

// Загружает все секции. Возвращает false, если хотя бы одна секция
// не загрузилась (остальные при этом всё равно прочитаны).
bool load_app_config(const toml::table &tbl, AppConfig &cfg);
