#include "processing_run.h"
#include "record_emitter.h"
#include "speed_pipeline.h"

#include <iostream>
#include <stdexcept>

ProcessingRun::ProcessingRun(std::string run_id, const AppConfig &cfg, Resources resources)
        : run_id_(std::move(run_id)), cfg_(cfg), res_(std::move(resources)) {}

ProcessingRun::~ProcessingRun() {
    wait();
}

void ProcessingRun::start() {
    std::lock_guard<std::mutex> lk(th_mutex_);
    // Уже запущено: ничего не делаем.
    if (started_.exchange(true, std::memory_order_acq_rel)) return;
    th_ = std::thread(&ProcessingRun::run, this);
}

void ProcessingRun::wait() {
    std::lock_guard<std::mutex> lk(th_mutex_);
    if (th_.joinable()) th_.join();
}

std::size_t ProcessingRun::execute() {
    progress_.publish(5, "Initializing...");

    if (!res_.source || !res_.detector || !res_.recognizer) {
        throw std::runtime_error("run is missing source, detector or recognizer");
    }

    // Ресурсы захватываются до первого кадра; ошибка здесь фатальна.
    res_.source->open();
    const VideoInfo info = res_.source->info();
    if (res_.video_sink) res_.video_sink->open(info);
    if (res_.record_sink) res_.record_sink->open();

    SpeedPipeline pipeline(*res_.detector, *res_.recognizer, cfg_);
    RecordEmitter emitter(res_.record_sink.get(), progress_.callback());

    const std::size_t count = pipeline.process(*res_.source, res_.video_sink.get(), emitter);
    detection_count_.store(count, std::memory_order_release);

    progress_.publish(95, "Saving results...");
    if (res_.record_sink) res_.record_sink->flush();
    return count;
}

void ProcessingRun::release_resources() {
    // Частично записанные файлы остаются как есть.
    try {
        if (res_.record_sink) res_.record_sink->close();
    } catch (const std::exception &e) {
        std::cerr << "[RUN] " << run_id_ << " record sink close failed: " << e.what() << std::endl;
    }
    try {
        if (res_.video_sink) res_.video_sink->close();
    } catch (const std::exception &e) {
        std::cerr << "[RUN] " << run_id_ << " video sink close failed: " << e.what() << std::endl;
    }
    try {
        if (res_.source) res_.source->close();
    } catch (const std::exception &e) {
        std::cerr << "[RUN] " << run_id_ << " source close failed: " << e.what() << std::endl;
    }
}

void ProcessingRun::run() {
    std::cout << "[RUN] " << run_id_ << " started" << std::endl;
    try {
        const std::size_t count = execute();
        release_resources();
        progress_.publish(100, "Completed! Found " + std::to_string(count) + " vehicle detections.");
        std::cout << "[RUN] " << run_id_ << " completed, records=" << count << std::endl;
    } catch (const std::exception &e) {
        release_resources();
        progress_.publish(PROGRESS_FAILED, std::string("Error: ") + e.what());
        std::cerr << "[RUN] " << run_id_ << " failed: " << e.what() << std::endl;
    } catch (...) {
        release_resources();
        progress_.publish(PROGRESS_FAILED, "Error: unknown error");
        std::cerr << "[RUN] " << run_id_ << " failed: unknown error" << std::endl;
    }
    finished_.store(true, std::memory_order_release);
}
