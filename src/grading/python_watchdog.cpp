#include "grading/python_watchdog.hpp"
#include "common/python.hpp"

namespace grader {
using namespace std;

const chrono::milliseconds WATCHDOG_REFIRE_INTERVAL(100);

python_watchdog::python_watchdog(chrono::milliseconds timeout)
    : thread_id(PyThread_get_thread_ident()),
      deadline(chrono::steady_clock::now() + timeout) {
    worker = thread([this] { run(); });
}

python_watchdog::~python_watchdog() {
    disarm();
    // 看门狗线程可能正在等待 GIL
    PyThread_guard release;
    worker.join();
}

python_watchdog::guard::guard(python_watchdog &watchdog) : watchdog(watchdog) {
    watchdog.guarded = true;
}

python_watchdog::guard::~guard() {
    watchdog.guarded = false;
}

void python_watchdog::disarm() {
    {
        lock_guard<mutex> lock(mut);
        if (finished) return;
        finished = true;
    }
    cond.notify_all();
    if (fired) PyThreadState_SetAsyncExc(thread_id, nullptr);
}

bool python_watchdog::expired() const {
    return fired;
}

bool python_watchdog::overdue() const {
    return chrono::steady_clock::now() >= deadline;
}

void python_watchdog::run() {
    unique_lock<mutex> lock(mut);
    if (cond.wait_until(lock, deadline, [this] { return finished; })) return;
    while (!finished) {
        lock.unlock();
        {
            GIL_guard gil;
            // 持有 GIL 时评测线程不可能在修改 guarded，也不可能在执行 disarm
            if (guarded && !is_finished()) {
                fired = true;
                PyThreadState_SetAsyncExc(thread_id, PyExc_TimeoutError);
            }
        }
        lock.lock();
        cond.wait_for(lock, WATCHDOG_REFIRE_INTERVAL, [this] { return finished; });
    }
}

bool python_watchdog::is_finished() {
    lock_guard<mutex> lock(mut);
    return finished;
}

}  // namespace grader
