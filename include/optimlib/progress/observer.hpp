#pragma once

#include "optimlib/progress/events.hpp"

namespace optimlib::progress {

    /**
     * @brief Read-only consumer of progress events.
     *
     * Every hook receives a const view of the event; nothing an observer
     * returns or throws reaches the solver. Hooks of one observer are called
     * from one thread at a time.
     */
    class IProgressObserver {
    public:
        virtual ~IProgressObserver() = default;

        virtual std::string name() const = 0;

        virtual void onStart(const TStartEvent&) {}
        virtual void onStep(const TStepEvent&) {}
        virtual void onBest(const TStepEvent&) {}
        virtual void onEnd(const TEndEvent&) {}
        virtual void close() {}
    };

} // namespace optimlib::progress
