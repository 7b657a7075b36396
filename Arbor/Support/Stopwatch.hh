//
// Stopwatch.hh
//
// Copyright 2017-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include <chrono>
#include <stdio.h>

namespace arbor {

/** A timer that can be stopped and restarted. Used by the performance tests. */
class Stopwatch {
public:
    using clock    = std::chrono::steady_clock;
    using duration = clock::duration;
    using seconds  = std::chrono::duration<double>;

    explicit Stopwatch(bool running =true) {
        if (running) start();
    }

    void start() {
        if (!_running) {
            _running = true;
            _start = clock::now();
        }
    }

    void stop() {
        if (_running) {
            _running = false;
            _total += clock::now() - _start;
        }
    }

    void reset() {
        _total = duration::zero();
        if (_running)
            _start = clock::now();
    }

    double elapsed() const {
        duration e = _total;
        if (_running)
            e += clock::now() - _start;
        return std::chrono::duration_cast<seconds>(e).count();
    }

    double elapsedMS() const    {return elapsed() * 1000.0;}

    /** Logs the elapsed time per operation, e.g. "Insert took 1.234 ms for 1000 elements". */
    void printReport(const char *what, size_t count, const char *item) const {
        auto ms = elapsedMS();
#ifdef NDEBUG
        fprintf(stderr, "%s took %.3f ms for %zu %ss (%.3f us/%s, or %.0f %ss/sec)\n",
                what, ms, count, item, ms/count*1000.0, item, count/ms*1000, item);
#else
        fprintf(stderr, "%s; %zu %ss (took %.3f ms, but this is UNOPTIMIZED CODE)\n",
                what, count, item, ms);
#endif
    }

private:
    duration _total {0};
    clock::time_point _start;
    bool _running {false};
};

}
