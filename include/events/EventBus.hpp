#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace folio::events {

struct Event {
    enum class Type {
        BookLoaded,
        LoadFailed,
        BookFinished,
        SeekCommitted,
        SleepTimerExpired,
        ProgressSaved,
        BookmarksChanged,
    };
    Type type;
    std::string book_id;
    double position = 0.0;    // Seconds, where the event happened
    std::string data;         // Error text or bookmark id
};

class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Event::Type type, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const Event& event);

private:
    struct Subscription {
        SubscriptionId id;
        Handler handler;
    };

    std::map<Event::Type, std::vector<Subscription>> subscribers_;
    SubscriptionId next_id_ = 1;
    std::mutex mutex_;
};

}  // namespace folio::events
