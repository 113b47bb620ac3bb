#include "worker.hpp"
#include <glog/logging.h>
#include <algorithm>

namespace grader {
using namespace std;

static void worker_loop(size_t worker_id, concurrent_queue<function<void()>> &task_queue) {
    DLOG(INFO) << "Worker " << worker_id << " started";
    function<void()> task;
    while (task_queue.wait_pop(task)) {
        try {
            task();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex.what();
        }
        task = nullptr;
    }
    DLOG(INFO) << "Worker " << worker_id << " exited";
}

worker_pool::worker_pool(size_t size) {
    size = max<size_t>(size, 1);
    for (size_t i = 0; i < size; ++i)
        workers.emplace_back(worker_loop, i, ref(task_queue));
}

worker_pool::~worker_pool() {
    stop();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
}

bool worker_pool::submit(function<void()> task) {
    return task_queue.push(move(task));
}

void worker_pool::stop() {
    task_queue.close();
}

size_t worker_pool::size() const {
    return workers.size();
}

}  // namespace grader
