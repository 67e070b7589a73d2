#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "config.h"
#include "progress.h"
#include "detection_record.h"
#include "detect/detection.h"
#include "io/frame_io.h"
#include "ocr/text_recognizer.h"

// ProcessingRun: один прогон видео в отдельном рабочем потоке.
//  - владеет своими коллабораторами, треками и слотом прогресса;
//  - опрашивающие потоки читают progress() в любой момент;
//  - любая ошибка (ресурсы, исключение в цикле) публикуется как
//    (-1, "Error: ...") и наружу не пробрасывается. Отмены нет.
class ProcessingRun {
public:
    struct Resources {
        std::unique_ptr<FrameSource> source;
        std::unique_ptr<FrameSink> video_sink; // - может быть nullptr.
        std::unique_ptr<RecordSink> record_sink; // - может быть nullptr.
        std::unique_ptr<ObjectDetector> detector;
        std::unique_ptr<TextRecognizer> recognizer;
    };

    ProcessingRun(std::string run_id, const AppConfig &cfg, Resources resources);
    ~ProcessingRun();

    ProcessingRun(const ProcessingRun &) = delete;
    ProcessingRun &operator=(const ProcessingRun &) = delete;

    // Запускает рабочий поток (повторный вызов ничего не делает).
    void start();

    // Блокирует до завершения рабочего потока. Можно звать из любого потока,
    // в том числе одновременно со start().
    void wait();

    // Выполняет прогон в текущем потоке.
    void run();

    bool finished() const { return finished_.load(std::memory_order_acquire); }
    ProgressStatus progress() const { return progress_.snapshot(); }
    const std::string &run_id() const { return run_id_; }
    std::size_t detection_count() const { return detection_count_.load(std::memory_order_acquire); }

private:
    std::string run_id_;
    AppConfig cfg_;
    Resources res_;

    ProgressSlot progress_; // - единственное состояние, общее с опрашивающими потоками.
    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    std::atomic<std::size_t> detection_count_{0};
    std::mutex th_mutex_; // - защищает th_ в start()/wait().
    std::thread th_;

    std::size_t execute();
    void release_resources();
};
