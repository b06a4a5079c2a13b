#include <cassert>

#include "../src/sinks/backoff.hpp"

using namespace udplogd;

int main() {
    BackoffOptions opts;
    opts.initial_ms = 1000;
    opts.max_ms = 30000;
    opts.factor = 2.0;
    opts.max_level = 16;
    BackoffSchedule s(opts);
    assert(s.level() == 0 && s.delay_ms() == 0);

    uint64_t last = 0;
    for (int i = 1; i <= 5; ++i) {
        s.advance();
        assert(s.delay_ms() > last);
        last = s.delay_ms();
    }
    assert(s.delay_ms_at(1) == 1000);
    assert(s.delay_ms_at(2) == 2000);
    assert(s.delay_ms_at(5) == 16000);
    assert(s.delay_ms_at(6) == 30000);
    assert(s.delay_ms_at(40) == 30000);

    for (int i = 0; i < 100; ++i) s.advance();
    assert(s.level() == 16);
    assert(s.delay_ms() == 30000);
    s.reset();
    assert(s.level() == 0 && s.delay_ms() == 0);
    return 0;
}
