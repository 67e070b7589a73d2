#include <toml++/toml.h>   // ДОЛЖНО БЫТЬ ПЕРВЫМ
#include "config.h"
#include <iostream>
#include <stdexcept>
#include <string_view>


// ============================================================================
// Реализация загрузки config.toml
//
// Важно:
//  - Любая ошибка парсинга не должна "убивать" приложение.
//  - В случае ошибки оставляем дефолты из структуры и возвращаем false.
//  - Отсутствующая таблица или ключ -> дефолт (это не ошибка).
//  - Все имена ключей должны соответствовать config.toml.
// ============================================================================

namespace {

const toml::table *find_table(const toml::table &tbl, std::string_view name) {
    const auto *node = tbl.get(name);
    if (!node) {
        return nullptr;
    }
    const auto *table = node->as_table();
    if (!table) {
        throw std::runtime_error("invalid [" + std::string(name) + "] table");
    }
    return table;
}

} // namespace


bool load_tracker_config(const toml::table &tbl, TrackerConfig &cfg) {
// ---------------------------- [tracker] ---------------------------
    try {
        const auto *tracker = find_table(tbl, "tracker");
        if (!tracker) {
            return true;
        }
        read_optional<float>(*tracker, "distance_gate_px", cfg.distance_gate_px);
        read_optional<int>(*tracker, "max_age_frames", cfg.max_age_frames);
        read_optional<int>(*tracker, "dormant_max_age_frames", cfg.dormant_max_age_frames);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "tracker config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_speed_config(const toml::table &tbl, SpeedConfig &cfg) {
// ----------------------------- [speed] ----------------------------
    try {
        const auto *speed = find_table(tbl, "speed");
        if (!speed) {
            return true;
        }
        read_optional<int>(*speed, "min_samples", cfg.min_samples);
        read_optional<int>(*speed, "max_intervals", cfg.max_intervals);
        read_optional<double>(*speed, "correction_factor", cfg.correction_factor);
        read_optional<double>(*speed, "max_plausible_kmh", cfg.max_plausible_kmh);
        read_optional<double>(*speed, "min_displacement_px", cfg.min_displacement_px);
        read_optional<double>(*speed, "smoothing_alpha", cfg.smoothing_alpha);
        if (cfg.smoothing_alpha <= 0.0 || cfg.smoothing_alpha > 1.0) {
            throw std::runtime_error("smoothing_alpha must be in (0, 1]");
        }
        return true;

    } catch (const std::exception &e) {
        std::cerr << "speed config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_calibration_config(const toml::table &tbl, CalibrationConfig &cfg) {
// -------------------------- [calibration] -------------------------
    try {
        const auto *calibration = find_table(tbl, "calibration");
        if (!calibration) {
            return true;
        }
        read_optional<double>(*calibration, "road_width_fraction", cfg.road_width_fraction);
        read_optional<int>(*calibration, "lanes", cfg.lanes);
        read_optional<double>(*calibration, "lane_width_m", cfg.lane_width_m);
        read_optional<double>(*calibration, "min_pixels_per_meter", cfg.min_pixels_per_meter);
        read_optional<double>(*calibration, "max_pixels_per_meter", cfg.max_pixels_per_meter);
        read_optional<double>(*calibration, "fixed_pixels_per_meter", cfg.fixed_pixels_per_meter);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "calibration config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_zone_config(const toml::table &tbl, ZoneConfig &cfg) {
// ------------------------------ [zone] ----------------------------
    try {
        const auto *zone = find_table(tbl, "zone");
        if (!zone) {
            return true;
        }
        read_optional<double>(*zone, "top_fraction", cfg.top_fraction);
        read_optional<double>(*zone, "bottom_fraction", cfg.bottom_fraction);
        read_optional<double>(*zone, "speed_limit_kmh", cfg.speed_limit_kmh);
        if (cfg.top_fraction > cfg.bottom_fraction) {
            throw std::runtime_error("top_fraction > bottom_fraction");
        }
        return true;

    } catch (const std::exception &e) {
        std::cerr << "zone config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_plate_config(const toml::table &tbl, PlateConfig &cfg) {
// ----------------------------- [plate] ----------------------------
    try {
        const auto *plate = find_table(tbl, "plate");
        if (!plate) {
            return true;
        }
        read_optional<double>(*plate, "slow_speed_kmh", cfg.slow_speed_kmh);
        read_optional<int>(*plate, "slow_cadence_frames", cfg.slow_cadence_frames);
        read_optional<int>(*plate, "fast_cadence_frames", cfg.fast_cadence_frames);
        read_optional<double>(*plate, "min_candidate_confidence", cfg.min_candidate_confidence);
        read_optional<int>(*plate, "min_text_length", cfg.min_text_length);
        read_optional<int>(*plate, "min_crop_side_px", cfg.min_crop_side_px);
        if (cfg.slow_cadence_frames <= 0 || cfg.fast_cadence_frames <= 0) {
            throw std::runtime_error("cadence must be positive");
        }
        return true;

    } catch (const std::exception &e) {
        std::cerr << "plate config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_intake_config(const toml::table &tbl, IntakeConfig &cfg) {
// ----------------------------- [intake] ---------------------------
    try {
        const auto *intake = find_table(tbl, "intake");
        if (!intake) {
            return true;
        }
        if (const auto *node = intake->get("vehicle_classes")) {
            const auto *arr = node->as_array();
            if (!arr) {
                throw std::runtime_error("vehicle_classes must be an array");
            }
            std::vector<int> classes;
            for (const auto &item : *arr) {
                const auto value = item.value<int>();
                if (!value) {
                    throw std::runtime_error("vehicle_classes must contain integers");
                }
                classes.push_back(*value);
            }
            cfg.vehicle_classes = std::move(classes);
        }
        read_optional<float>(*intake, "min_confidence", cfg.min_confidence);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "intake config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_overlay_config(const toml::table &tbl, OverlayConfig &cfg) {
// ---------------------------- [overlay] ---------------------------
    try {
        const auto *overlay = find_table(tbl, "overlay");
        if (!overlay) {
            return true;
        }
        read_optional<bool>(*overlay, "enabled", cfg.enabled);
        read_optional<double>(*overlay, "font_scale", cfg.font_scale);
        read_optional<bool>(*overlay, "draw_zone", cfg.draw_zone);
        read_optional<bool>(*overlay, "draw_frame_info", cfg.draw_frame_info);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "overlay config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_output_config(const toml::table &tbl, OutputConfig &cfg) {
// ----------------------------- [output] ---------------------------
    try {
        const auto *output = find_table(tbl, "output");
        if (!output) {
            return true;
        }
        if (const auto *node = output->get("codecs")) {
            const auto *arr = node->as_array();
            if (!arr) {
                throw std::runtime_error("codecs must be an array");
            }
            std::vector<std::string> codecs;
            for (const auto &item : *arr) {
                const auto value = item.value<std::string>();
                if (!value || value->size() != 4) {
                    throw std::runtime_error("codecs must contain fourcc strings");
                }
                codecs.push_back(*value);
            }
            cfg.codecs = std::move(codecs);
        }
        read_optional<int>(*output, "max_width", cfg.max_width);
        read_optional<int>(*output, "max_height", cfg.max_height);
        std::string separator(1, cfg.csv_separator);
        read_optional<std::string>(*output, "csv_separator", separator);
        if (separator.size() != 1) {
            throw std::runtime_error("csv_separator must be a single character");
        }
        cfg.csv_separator = separator[0];
        return true;

    } catch (const std::exception &e) {
        std::cerr << "output config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_detector_config(const toml::table &tbl, DetectorConfig &cfg) {
// ---------------------------- [detector] --------------------------
    try {
        const auto *detector = find_table(tbl, "detector");
        if (!detector) {
            return true;
        }
        read_optional<std::string>(*detector, "rknn_model_path", cfg.rknn_model_path);
        read_optional<float>(*detector, "rknn_scale", cfg.rknn_scale);
        read_optional<bool>(*detector, "rknn_swap_rb", cfg.rknn_swap_rb);
        read_optional<float>(*detector, "rknn_conf_threshold", cfg.rknn_conf_threshold);
        read_optional<float>(*detector, "rknn_nms_threshold", cfg.rknn_nms_threshold);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "detector config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_ocr_config(const toml::table &tbl, OcrConfig &cfg) {
// ------------------------------ [ocr] -----------------------------
    try {
        const auto *ocr = find_table(tbl, "ocr");
        if (!ocr) {
            return true;
        }
        read_optional<std::string>(*ocr, "tessdata_path", cfg.tessdata_path);
        read_optional<std::string>(*ocr, "language", cfg.language);
        read_optional<std::string>(*ocr, "char_whitelist", cfg.char_whitelist);
        read_optional<int>(*ocr, "page_seg_mode", cfg.page_seg_mode);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "ocr config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_video_config(const toml::table &tbl, VideoConfig &cfg) {
// ----------------------------- [video] ----------------------------
    try {
        const auto *video = find_table(tbl, "video");
        if (!video) {
            return true;
        }
        read_optional<std::string>(*video, "decoder", cfg.decoder);
        read_optional<int>(*video, "pull_timeout_ms", cfg.pull_timeout_ms);
        read_optional<bool>(*video, "verbose", cfg.verbose);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "video config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_run_config(const toml::table &tbl, RunConfig &cfg) {
// ------------------------------ [run] -----------------------------
    try {
        const auto *run = find_table(tbl, "run");
        if (!run) {
            return true;
        }
        read_optional<int>(*run, "log_every_n_frames", cfg.log_every_n_frames);
        read_optional<int>(*run, "poll_interval_ms", cfg.poll_interval_ms);
        return true;

    } catch (const std::exception &e) {
        std::cerr << "run config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg) {
// ---------------------------- [logging] ---------------------------
    try {
        const auto *logging = find_table(tbl, "logging");
        if (!logging) {
            return true;
        }
        cfg.tracker_level_logger = read_required<bool>(*logging, "tracker_level_logger");
        cfg.speed_level_logger = read_required<bool>(*logging, "speed_level_logger");
        cfg.plate_level_logger = read_required<bool>(*logging, "plate_level_logger");
        cfg.pipeline_level_logger = read_required<bool>(*logging, "pipeline_level_logger");
        cfg.detector_level_logger = read_required<bool>(*logging, "detector_level_logger");
        return true;

    } catch (const std::exception &e) {
        std::cerr << "logging config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_app_config(const toml::table &tbl, AppConfig &cfg) {
    bool ok = true;
    ok = load_tracker_config(tbl, cfg.tracker) && ok;
    ok = load_speed_config(tbl, cfg.speed) && ok;
    ok = load_calibration_config(tbl, cfg.calibration) && ok;
    ok = load_zone_config(tbl, cfg.zone) && ok;
    ok = load_plate_config(tbl, cfg.plate) && ok;
    ok = load_intake_config(tbl, cfg.intake) && ok;
    ok = load_overlay_config(tbl, cfg.overlay) && ok;
    ok = load_output_config(tbl, cfg.output) && ok;
    ok = load_detector_config(tbl, cfg.detector) && ok;
    ok = load_ocr_config(tbl, cfg.ocr) && ok;
    ok = load_video_config(tbl, cfg.video) && ok;
    ok = load_run_config(tbl, cfg.run) && ok;
    ok = load_logging_config(tbl, cfg.logging) && ok;
    return ok;
}
