#pragma once

#include <optional>

namespace live_proxy {

enum class Outcome { Success, Failure };

inline bool is_failure(Outcome o) { return o == Outcome::Failure; }

inline const char* to_string(Outcome o) {
    return o == Outcome::Success ? "success" : "failure";
}

// Handle to a started operation.
//
// finish() blocks until the effect is over. try_finish() never blocks and
// returns std::nullopt while the effect is still in progress. cancel()
// forcibly stops the effect; it may be called any number of times, also
// after the effect has ended, and does not wait (call finish() to join).
class RunningOperation {
public:
    virtual ~RunningOperation() = default;

    virtual Outcome finish() = 0;
    virtual std::optional<Outcome> try_finish() = 0;
    virtual void cancel() = 0;
};

// For operations that do all their work inside start().
class CompletedOperation : public RunningOperation {
public:
    explicit CompletedOperation(Outcome outcome) : outcome_(outcome) {}

    Outcome finish() override { return outcome_; }
    std::optional<Outcome> try_finish() override { return outcome_; }
    void cancel() override {}

private:
    Outcome outcome_;
};

} // namespace live_proxy
