#pragma once

#include "address_router.hpp"

#include <eoslink/records.hpp>

#include <functional>
#include <vector>

namespace eoslink
{

// Keeps a ConsoleState current from the console's unsolicited notifications.
//
// attach() registers one standing handler per notification address; each
// handler overwrites one field. Cue notifications are only taken from their
// "/text" variant. A notification that cannot be decoded is logged and
// dropped, so it never disturbs a call that happens to be pumping.
class ConsoleStateModel
{
   public:
    using ChangeCallback = std::function<void(const ConsoleState&)>;

    ConsoleStateModel() = default;

    ConsoleStateModel(const ConsoleStateModel&)            = delete;
    ConsoleStateModel& operator=(const ConsoleStateModel&) = delete;

    void attach(AddressRouter& router);
    void detach();
    bool attached() const { return !registrations_.empty(); }

    const ConsoleState& snapshot() const { return state_; }

    // Called after every applied update.
    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    template <typename Mutate>
    void apply(const osc::Message& msg, Mutate&& mutate);

    void on_cue(const osc::Message& msg, std::optional<Cue> ConsoleState::*slot);

    ConsoleState                     state_;
    ChangeCallback                   on_change_;
    std::vector<HandlerRegistration> registrations_;
};

}   // namespace eoslink
