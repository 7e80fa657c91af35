#pragma once

#include "model/Book.hpp"
#include "model/Playback.hpp"
#include <functional>
#include <string>
#include <vector>

namespace folio::engine {

// The playback backend as seen by the coordinator. Implementations deliver
// status updates and load completions on the thread that drives the event
// loop, never from their own worker threads.
class AudioEngine {
public:
    using StatusCallback = std::function<void(const model::PlaybackStatus&)>;
    // ok == false carries a human-readable error
    using Completion = std::function<void(bool ok, const std::string& error)>;

    virtual ~AudioEngine() = default;

    virtual void load_audio(const std::string& url, double start_position,
                            const model::BookMetadata& metadata, bool auto_play,
                            Completion done) = 0;
    virtual void load_tracks(const std::vector<model::TrackInfo>& tracks, double start_position,
                             const model::BookMetadata& metadata, bool auto_play,
                             Completion done) = 0;

    virtual bool play() = 0;
    virtual bool pause() = 0;
    // Book-global seconds
    virtual bool seek_to(double position) = 0;
    virtual bool set_playback_rate(double rate) = 0;
    virtual void unload() = 0;

    [[nodiscard]] virtual bool is_loaded() const = 0;
    virtual void set_status_callback(StatusCallback callback) = 0;
};

}  // namespace folio::engine
