#include <frameline/core/job_system.hpp>
#include <frameline/core/log.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace frameline::core {

namespace {

class WorkerPool {
public:
    ~WorkerPool() { stop(); }

    void start(int num_threads) {
        if (!m_workers.empty()) {
            log(LogLevel::Warn, "JobSystem: already initialized");
            return;
        }

        if (num_threads <= 0) {
            num_threads = static_cast<int>(std::thread::hardware_concurrency());
            if (num_threads > 1) num_threads--; // Leave one for the render loop
        }
        if (num_threads < 1) num_threads = 1;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = false;
        }

        m_workers.reserve(num_threads);
        for (int i = 0; i < num_threads; ++i) {
            m_workers.emplace_back([this] { run_worker(); });
        }
        m_thread_count = num_threads;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_wake.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        m_workers.clear();
        m_thread_count = 0;
    }

    void enqueue(std::function<void()> job) {
        if (m_thread_count == 0) {
            job();
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_queue.push_back(std::move(job));
            m_pending++;
        }
        m_wake.notify_one();
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [this] { return m_pending == 0; });
    }

    int thread_count() const { return m_thread_count; }

    bool owns_current_thread() const {
        auto id = std::this_thread::get_id();
        for (const auto& worker : m_workers) {
            if (worker.get_id() == id) return true;
        }
        return false;
    }

private:
    void run_worker() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_wake.wait(lock, [this] { return m_stopping || !m_queue.empty(); });

                // Drain the queue before honoring shutdown
                if (m_queue.empty()) {
                    return;
                }

                job = std::move(m_queue.front());
                m_queue.pop_front();
            }

            try {
                job();
            } catch (const std::exception& e) {
                log(LogLevel::Error, (std::string("JobSystem: job threw: ") + e.what()).c_str());
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (--m_pending == 0) {
                    m_idle.notify_all();
                }
            }
        }
    }

    std::vector<std::thread> m_workers;
    std::deque<std::function<void()>> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    bool m_stopping = false;
    int m_pending = 0;
    std::atomic<int> m_thread_count{0};
};

WorkerPool g_pool;

} // anonymous namespace

void JobSystem::init(int num_threads) {
    g_pool.start(num_threads);
}

void JobSystem::shutdown() {
    g_pool.stop();
}

void JobSystem::submit(std::function<void()> job) {
    g_pool.enqueue(std::move(job));
}

void JobSystem::wait_all() {
    g_pool.wait_idle();
}

int JobSystem::thread_count() {
    return g_pool.thread_count();
}

bool JobSystem::is_worker_thread() {
    return g_pool.owns_current_thread();
}

} // namespace frameline::core
