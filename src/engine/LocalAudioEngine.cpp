#include "engine/LocalAudioEngine.hpp"
#include "audio/PipeWireOutput.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace folio::engine {

namespace {

constexpr int BUFFER_FRAMES = 4096;
constexpr auto STATUS_INTERVAL = std::chrono::milliseconds(100);
constexpr auto PUMP_INTERVAL = std::chrono::milliseconds(50);
constexpr auto IDLE_SLEEP = std::chrono::milliseconds(20);

std::unique_ptr<audio::AudioDecoder> open_track(const model::TrackInfo& track) {
    auto decoder = audio::create_decoder(track.url);
    if (!decoder) return nullptr;
    if (!decoder->open(track.url)) return nullptr;
    if (decoder->sample_rate() <= 0 || decoder->channels() <= 0) {
        util::Logger::error("LocalAudioEngine: Decoder reported no audio format for " + track.url);
        return nullptr;
    }
    return decoder;
}

}  // namespace

LocalAudioEngine::LocalAudioEngine(events::Scheduler& scheduler)
    : scheduler_(scheduler) {
    context_ready_ = context_.init();
    if (!context_ready_) {
        util::Logger::error("LocalAudioEngine: PipeWire is unavailable, loads will fail");
    }

    pump_task_ = scheduler_.schedule("engine-status", PUMP_INTERVAL, [this]() { pump_statuses(); });
}

LocalAudioEngine::~LocalAudioEngine() {
    *alive_ = false;
    pump_task_.cancel();
    stop_worker();
}

void LocalAudioEngine::load_audio(const std::string& url, double start_position,
                                  const model::BookMetadata& metadata, bool auto_play,
                                  Completion done) {
    model::TrackInfo track;
    track.url = url;
    track.title = metadata.title;
    load_tracks({track}, start_position, metadata, auto_play, std::move(done));
}

void LocalAudioEngine::load_tracks(const std::vector<model::TrackInfo>& tracks, double start_position,
                                   const model::BookMetadata& metadata, bool auto_play,
                                   Completion done) {
    stop_worker();

    uint64_t generation = ++generation_;
    util::Logger::info("LocalAudioEngine: Loading '" + metadata.title + "' (" +
                       std::to_string(tracks.size()) + " tracks)");

    if (tracks.empty()) {
        complete(generation, done, false, "No audio tracks to load");
        return;
    }
    if (!context_ready_) {
        complete(generation, done, false, "Audio output unavailable");
        return;
    }

    playing_ = auto_play;
    rate_ = 1.0;
    {
        std::lock_guard<std::mutex> lock(seek_mutex_);
        pending_seek_.reset();
    }

    Job job{tracks, std::max(0.0, start_position), generation, std::move(done)};
    worker_ = std::jthread([this, job = std::move(job)](std::stop_token st) mutable {
        run(st, std::move(job));
    });
}

bool LocalAudioEngine::play() {
    if (!loaded_) return false;
    playing_ = true;
    return true;
}

bool LocalAudioEngine::pause() {
    if (!loaded_) return false;
    playing_ = false;
    return true;
}

bool LocalAudioEngine::seek_to(double position) {
    if (!loaded_) return false;
    {
        std::lock_guard<std::mutex> lock(seek_mutex_);
        pending_seek_ = PendingSeek{std::max(0.0, position), ++seek_epoch_};
    }
    statuses_.clear();
    return true;
}

bool LocalAudioEngine::set_playback_rate(double rate) {
    if (!loaded_ || rate <= 0.0) return false;
    rate_ = rate;
    return true;
}

void LocalAudioEngine::unload() {
    ++generation_;
    stop_worker();
    statuses_.clear();
    util::Logger::debug("LocalAudioEngine: Unloaded");
}

void LocalAudioEngine::stop_worker() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
    loaded_ = false;
    playing_ = false;
}

void LocalAudioEngine::complete(uint64_t generation, const Completion& done, bool ok,
                                const std::string& error) {
    if (!done) return;
    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([this, alive, generation, done, ok, error]() {
        auto token = alive.lock();
        if (!token || !*token) return;
        if (generation != generation_.load()) {
            util::Logger::debug("LocalAudioEngine: Dropping completion of superseded load");
            return;
        }
        done(ok, error);
    });
}

void LocalAudioEngine::pump_statuses() {
    auto pending = statuses_.drain(seek_epoch_.load());
    if (pending.empty() || !status_callback_) return;
    for (const auto& status : pending) {
        status_callback_(status);
    }
}

std::optional<LocalAudioEngine::PendingSeek> LocalAudioEngine::take_pending_seek() {
    std::lock_guard<std::mutex> lock(seek_mutex_);
    auto seek = pending_seek_;
    pending_seek_.reset();
    return seek;
}

size_t LocalAudioEngine::track_for(const std::vector<model::TrackInfo>& tracks, double position) {
    size_t index = 0;
    for (size_t i = 0; i < tracks.size(); ++i) {
        if (tracks[i].start_offset <= position) {
            index = i;
        } else {
            break;
        }
    }
    return index;
}

double LocalAudioEngine::total_duration(const std::vector<model::TrackInfo>& tracks) {
    double total = 0.0;
    for (const auto& track : tracks) {
        total = std::max(total, track.start_offset + track.duration);
    }
    return total;
}

void LocalAudioEngine::run(std::stop_token stop_token, Job job) {
    const auto& tracks = job.tracks;
    size_t track = track_for(tracks, job.start_position);

    auto decoder = open_track(tracks[track]);
    if (!decoder) {
        complete(job.generation, job.done, false, "Cannot open " + tracks[track].url);
        return;
    }

    double local_start = job.start_position - tracks[track].start_offset;
    if (local_start > 0.0 && !decoder->seek_to_seconds(local_start)) {
        util::Logger::warn("LocalAudioEngine: Initial seek failed, starting track from the top");
    }

    double duration = total_duration(tracks);
    if (duration <= 0.0) duration = decoder->duration_seconds();

    loaded_ = true;
    complete(job.generation, job.done, true, "");

    audio::PipeWireOutput output;
    int output_rate = 0;
    int output_channels = 0;
    std::vector<float> buffer;
    auto last_report = std::chrono::steady_clock::now() - STATUS_INTERVAL;
    bool finished = false;
    uint64_t applied_epoch = seek_epoch_.load();

    auto report = [&](bool force, bool did_just_finish) {
        auto now = std::chrono::steady_clock::now();
        if (!force && now - last_report < STATUS_INTERVAL) return;
        last_report = now;

        model::PlaybackStatus status;
        status.position = did_just_finish ? duration : tracks[track].start_offset + decoder->position_seconds();
        status.duration = duration;
        status.is_playing = playing_.load();
        status.did_just_finish = did_just_finish;
        statuses_.push(status, applied_epoch);
    };

    auto switch_track = [&](size_t next) -> bool {
        auto next_decoder = open_track(tracks[next]);
        if (!next_decoder) {
            util::Logger::error("LocalAudioEngine: Cannot open track " + tracks[next].url);
            return false;
        }
        decoder = std::move(next_decoder);
        track = next;
        util::Logger::debug("LocalAudioEngine: Now on track " + std::to_string(track + 1) + "/" +
                            std::to_string(tracks.size()));
        return true;
    };

    while (!stop_token.stop_requested()) {
        if (auto seek = take_pending_seek()) {
            size_t target = track_for(tracks, seek->position);
            if (target == track || switch_track(target)) {
                if (!decoder->seek_to_seconds(seek->position - tracks[track].start_offset)) {
                    util::Logger::warn("LocalAudioEngine: Seek to " + std::to_string(seek->position) + "s failed");
                }
                finished = false;
                output.flush();
            }
            applied_epoch = seek->epoch;
            report(true, false);
        }

        if (!playing_ || finished) {
            output.pause(true);
            report(false, false);
            std::this_thread::sleep_for(IDLE_SLEEP);
            continue;
        }

        // Rate changes resample by retuning the output clock.
        // TODO: pitch-preserving time-stretch so narration above 1.0x keeps its pitch
        int wanted_rate = static_cast<int>(std::lround(decoder->sample_rate() * rate_.load()));
        if (!output.is_initialized() || wanted_rate != output_rate || decoder->channels() != output_channels) {
            output.close();
            if (!output.init(context_, wanted_rate, decoder->channels())) {
                util::Logger::error("LocalAudioEngine: Output init failed, pausing");
                playing_ = false;
                report(true, false);
                continue;
            }
            output_rate = wanted_rate;
            output_channels = decoder->channels();
            buffer.assign(static_cast<size_t>(BUFFER_FRAMES) * output_channels, 0.0f);
        }
        output.pause(false);

        int frames = decoder->read_pcm(buffer.data(), BUFFER_FRAMES);
        if (frames <= 0) {
            if (track + 1 < tracks.size() && switch_track(track + 1)) {
                continue;
            }
            util::Logger::info("LocalAudioEngine: End of book");
            finished = true;
            playing_ = false;
            report(true, true);
            continue;
        }

        size_t written = 0;
        while (written < static_cast<size_t>(frames) && !stop_token.stop_requested()) {
            size_t n = output.write(buffer.data() + written * output_channels, frames - written, stop_token);
            if (n == 0) break;
            written += n;
        }

        report(false, false);
    }

    output.close();
}

}  // namespace folio::engine
