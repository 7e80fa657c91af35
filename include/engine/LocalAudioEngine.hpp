#pragma once

#include "audio/AudioDecoder.hpp"
#include "audio/PipeWireContext.hpp"
#include "engine/AudioEngine.hpp"
#include "engine/StatusChannel.hpp"
#include "events/Scheduler.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace folio::engine {

// Plays local files through PipeWire. Decoding runs on a worker thread;
// statuses and completions are marshalled onto the scheduler's thread.
class LocalAudioEngine : public AudioEngine {
public:
    explicit LocalAudioEngine(events::Scheduler& scheduler);
    ~LocalAudioEngine() override;

    LocalAudioEngine(const LocalAudioEngine&) = delete;
    LocalAudioEngine& operator=(const LocalAudioEngine&) = delete;

    void load_audio(const std::string& url, double start_position,
                    const model::BookMetadata& metadata, bool auto_play,
                    Completion done) override;
    void load_tracks(const std::vector<model::TrackInfo>& tracks, double start_position,
                     const model::BookMetadata& metadata, bool auto_play,
                     Completion done) override;

    bool play() override;
    bool pause() override;
    bool seek_to(double position) override;
    bool set_playback_rate(double rate) override;
    void unload() override;

    [[nodiscard]] bool is_loaded() const override { return loaded_.load(); }
    void set_status_callback(StatusCallback callback) override { status_callback_ = std::move(callback); }

private:
    struct Job {
        std::vector<model::TrackInfo> tracks;
        double start_position = 0.0;
        uint64_t generation = 0;
        Completion done;
    };

    void run(std::stop_token stop_token, Job job);
    void complete(uint64_t generation, const Completion& done, bool ok, const std::string& error);
    void pump_statuses();
    struct PendingSeek {
        double position = 0.0;
        uint64_t epoch = 0;
    };
    std::optional<PendingSeek> take_pending_seek();
    void stop_worker();

    static size_t track_for(const std::vector<model::TrackInfo>& tracks, double position);
    static double total_duration(const std::vector<model::TrackInfo>& tracks);

    events::Scheduler& scheduler_;
    audio::PipeWireContext context_;
    bool context_ready_ = false;

    StatusChannel statuses_;
    StatusCallback status_callback_;
    events::TaskHandle pump_task_;

    std::atomic<bool> loaded_{false};
    std::atomic<bool> playing_{false};
    std::atomic<double> rate_{1.0};
    std::atomic<uint64_t> generation_{0};

    // Bumped by every seek; statuses stamped with an older epoch are stale
    std::atomic<uint64_t> seek_epoch_{0};
    std::mutex seek_mutex_;
    std::optional<PendingSeek> pending_seek_;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
    std::jthread worker_;
};

}  // namespace folio::engine
