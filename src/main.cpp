#include <gst/gst.h>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "config.h"
#include "processing_run.h"
#include "detect/rknn_detector.h"
#include "io/csv_record_sink.h"
#include "io/gst_frame_source.h"
#include "io/video_file_sink.h"
#include "ocr/tesseract_recognizer.h"

static constexpr int EXIT_RUN_FAILED = 1;
static constexpr int EXIT_USAGE = 2;

static void print_usage(const char *prog) {
    std::cerr << "usage: " << prog
              << " <input_video> <output_video> <output_csv> [config.toml]" << std::endl;
}

int main(int argc, char *argv[]) {

    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    gst_init(&argc, &argv);

    if (argc < 4 || argc > 5) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    const std::string input_path = argv[1];
    const std::string video_path = argv[2];
    const std::string csv_path = argv[3];
    const std::string config_path = argc == 5 ? argv[4] : "config.toml";

    // получаем конфигурацию из config.toml
    AppConfig cfg;
    try {
        toml::table tbl = toml::parse_file(config_path);
        if (!load_app_config(tbl, cfg)) {
            std::cerr << "[MAIN] invalid configuration in " << config_path << std::endl;
            return EXIT_USAGE;
        }
    } catch (const toml::parse_error &e) {
        std::cerr << "[MAIN] cannot parse " << config_path << ": " << e.description()
                  << " (" << e.source().begin << ")" << std::endl;
        return EXIT_USAGE;
    }

    // Модель и OCR грузятся до старта: без них прогон не имеет смысла.
    ProcessingRun::Resources res;
    try {
        res.source = std::make_unique<GstFrameSource>(input_path, cfg.video);
        res.video_sink = std::make_unique<VideoFileSink>(video_path, cfg.output);
        res.record_sink = std::make_unique<CsvRecordSink>(csv_path, cfg.output.csv_separator);
        res.detector = std::make_unique<RknnDetector>(cfg.detector, cfg.logging.detector_level_logger);
        res.recognizer = std::make_unique<TesseractRecognizer>(cfg.ocr);
    } catch (const std::exception &e) {
        std::cerr << "[MAIN] startup failed: " << e.what() << std::endl;
        return EXIT_RUN_FAILED;
    }

    ProcessingRun run(input_path, cfg, std::move(res));
    run.start();

    const auto poll = std::chrono::milliseconds(cfg.run.poll_interval_ms > 0 ? cfg.run.poll_interval_ms : 500);
    while (!run.finished()) {
        std::this_thread::sleep_for(poll);
        const ProgressStatus st = run.progress();
        if (st.failed()) break;
        std::cout << "[RUN] " << std::fixed << std::setprecision(1) << st.percentage
                  << "% " << st.message << std::defaultfloat << std::endl;
    }
    run.wait();

    const ProgressStatus final_status = run.progress();
    if (final_status.failed()) {
        std::cerr << "[MAIN] " << final_status.message << std::endl;
        return EXIT_RUN_FAILED;
    }
    std::cout << "[MAIN] " << final_status.message << std::endl;
    std::cout << "[MAIN] video: " << video_path << std::endl;
    std::cout << "[MAIN] csv: " << csv_path << std::endl;
    return 0;
}
