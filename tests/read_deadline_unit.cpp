#include <boost/asio.hpp>
#include <chrono>
#include <iostream>
#include <thread>
#include "net/ReadDeadline.h"

namespace net = boost::asio;

// The timer expires before the read completes, but its handler has not run
// yet. Finishing the read must turn that handler into a no-op.
static int check_queued_expiry_after_read() {
    net::io_context ioc;
    net::steady_timer timer(ioc);
    ReadDeadline deadline;
    bool closed = false;

    const unsigned gen = deadline.arm();
    timer.expires_after(std::chrono::milliseconds(1));
    timer.async_wait([&](const boost::system::error_code& ec) {
        if (!ec && deadline.current(gen)) closed = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    // header arrived. No cancel(): once the handler is queued it would not
    // help, and the handler still sees a success code.
    deadline.finish();
    ioc.run();

    if (closed) { std::cerr << "stale timer closed a connection after its read finished\n"; return 1; }
    return 0;
}

static int check_expiry_while_reading() {
    net::io_context ioc;
    net::steady_timer timer(ioc);
    ReadDeadline deadline;
    bool closed = false;

    const unsigned gen = deadline.arm();
    timer.expires_after(std::chrono::milliseconds(1));
    timer.async_wait([&](const boost::system::error_code& ec) {
        if (!ec && deadline.current(gen)) closed = true;
    });
    ioc.run();

    if (!closed) { std::cerr << "timer for a pending read did not fire\n"; return 1; }
    return 0;
}

// header timer left over from a keep-alive read must not hit the body read
static int check_rearm() {
    ReadDeadline deadline;
    const unsigned header_gen = deadline.arm();
    deadline.finish();
    const unsigned body_gen = deadline.arm();
    if (deadline.current(header_gen)) { std::cerr << "old generation still current\n"; return 1; }
    if (!deadline.current(body_gen)) { std::cerr << "new generation not current\n"; return 1; }
    deadline.finish();
    if (deadline.current(body_gen)) { std::cerr << "finished read still current\n"; return 1; }
    return 0;
}

int main() {
    if (check_queued_expiry_after_read() != 0) return 1;
    if (check_expiry_while_reading() != 0) return 1;
    if (check_rearm() != 0) return 1;

    std::cout << "read_deadline_unit ok\n";
    return 0;
}
