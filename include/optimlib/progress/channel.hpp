#pragma once

#include "optimlib/progress/observer.hpp"

namespace optimlib::progress {

    /**
     * @brief Fan-out of progress events with an append-only history.
     *
     * publish() is safe from several runs at once; events of one run keep
     * their order. Every step is appended to the history exactly once,
     * whatever the throttling and whatever the observers do. Start and End
     * events always reach every observer; a step reaches an observer when
     * at least one of its active thresholds (throttle_s, update_every) is
     * met, measured per run. Observers are called in subscription order and
     * an observer that throws is logged and skipped.
     *
     * Observers must not publish from inside a hook.
     */
    class ProgressChannel {
    public:
        using Clock = std::function<double()>;

        explicit ProgressChannel(TThrottle defaults = {}, Clock clock = nullptr);

        void subscribe(std::shared_ptr<IProgressObserver> observer, std::optional<TThrottle> throttle = std::nullopt);

        void publish(const TProgressEvent& event);

        // Calls close() once on every observer
        void close();

        std::vector<core::THistoryRecord> history() const;
        std::vector<TProgressEvent> events() const;
        std::size_t observerCount() const;
        const TThrottle& defaults() const { return defaults_; }

    private:
        struct TRunState
        {
            double lastDelivery = 0.0;
            int pending = 0;            // steps since the last delivery
        };

        struct TSubscriber
        {
            std::shared_ptr<IProgressObserver> observer;
            TThrottle throttle;
            std::map<int, TRunState> runs;
        };

        bool admit(TSubscriber& sub, const TStepEvent& step, double now);

        template <typename Hook>
        void deliver(TSubscriber& sub, const char* hook, Hook&& call);

        TThrottle defaults_;
        Clock clock_;

        mutable std::mutex mtx_;
        std::vector<TSubscriber> subscribers_;
        std::vector<core::THistoryRecord> history_;
        std::vector<TProgressEvent> events_;
        bool closed_ = false;
    };

} // namespace optimlib::progress
