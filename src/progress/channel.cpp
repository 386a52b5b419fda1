#include "optimlib/progress/channel.hpp"
#include "optimlib/core/errors.hpp"
#include "optimlib/core/method.hpp"

namespace optimlib::progress {

    static void ValidateThrottle(const TThrottle& t)
    {
        if (!(t.throttle_s >= 0.0))
            throw core::ConfigurationError("progress throttle_s must be >= 0");
        if (t.update_every < 1)
            throw core::ConfigurationError("progress update_every must be >= 1");
    }

    ProgressChannel::ProgressChannel(TThrottle defaults, Clock clock)
        : defaults_(defaults), clock_(clock ? std::move(clock) : Clock(core::get_time_in_seconds))
    {
        ValidateThrottle(defaults_);
    }

    void ProgressChannel::subscribe(std::shared_ptr<IProgressObserver> observer, std::optional<TThrottle> throttle)
    {
        if (!observer) throw core::ConfigurationError("cannot subscribe an empty observer");

        TThrottle t = throttle.value_or(defaults_);
        ValidateThrottle(t);

        std::lock_guard<std::mutex> lock(mtx_);
        subscribers_.push_back({ std::move(observer), t, {} });
    }

    template <typename Hook>
    void ProgressChannel::deliver(TSubscriber& sub, const char* hook, Hook&& call)
    {
        try {
            call(*sub.observer);
        } catch (const std::exception& e) {
            std::cerr << "[progress] observer '" << sub.observer->name() << "' failed in " << hook
                      << ": " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[progress] observer '" << sub.observer->name() << "' failed in " << hook
                      << ": unknown exception" << std::endl;
        }
    }

    bool ProgressChannel::admit(TSubscriber& sub, const TStepEvent& step, double now)
    {
        auto [it, inserted] = sub.runs.try_emplace(step.run_index);
        TRunState& state = it->second;
        if (inserted) state.lastDelivery = now;

        state.pending++;

        const bool timed = sub.throttle.throttle_s > 0.0;
        const bool counted = sub.throttle.update_every > 1;

        bool deliver = !timed && !counted;
        if (timed && now - state.lastDelivery >= sub.throttle.throttle_s) deliver = true;
        if (counted && state.pending >= sub.throttle.update_every) deliver = true;

        if (deliver) {
            state.lastDelivery = now;
            state.pending = 0;
        }
        return deliver;
    }

    void ProgressChannel::publish(const TProgressEvent& event)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        const double now = clock_();

        events_.push_back(event);

        if (const auto* start = std::get_if<TStartEvent>(&event)) {
            for (auto& sub : subscribers_) {
                sub.runs[start->run_index] = TRunState{ now, 0 };
                deliver(sub, "on_start", [&](IProgressObserver& o) { o.onStart(*start); });
            }
        } else if (const auto* step = std::get_if<TStepEvent>(&event)) {
            history_.push_back(*step);
            for (auto& sub : subscribers_) {
                if (admit(sub, *step, now))
                    deliver(sub, "on_step", [&](IProgressObserver& o) { o.onStep(*step); });
                if (step->is_best)
                    deliver(sub, "on_best", [&](IProgressObserver& o) { o.onBest(*step); });
            }
        } else if (const auto* end = std::get_if<TEndEvent>(&event)) {
            for (auto& sub : subscribers_)
                deliver(sub, "on_end", [&](IProgressObserver& o) { o.onEnd(*end); });
        }
    }

    void ProgressChannel::close()
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_) return;
        closed_ = true;

        for (auto& sub : subscribers_)
            deliver(sub, "close", [](IProgressObserver& o) { o.close(); });
    }

    std::vector<core::THistoryRecord> ProgressChannel::history() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return history_;
    }

    std::vector<TProgressEvent> ProgressChannel::events() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return events_;
    }

    std::size_t ProgressChannel::observerCount() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return subscribers_.size();
    }

} // namespace optimlib::progress
