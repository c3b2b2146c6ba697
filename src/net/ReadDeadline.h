#pragma once

// Ties a read timer to the read it was armed for. Cancelling a steady_timer
// whose handler is already queued does not stop that handler, so the handler
// checks `current(gen)` before acting.
class ReadDeadline {
public:
    unsigned arm() { return ++gen_; }
    void finish() { ++gen_; }
    bool current(unsigned gen) const { return gen == gen_; }
private:
    unsigned gen_ = 0;
};
