#ifndef THREAD_UTILS_HPP
#define THREAD_UTILS_HPP
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief RAII wrapper that joins the thread on destruction.
 */
struct ThreadGuard {
    std::thread t;
    ThreadGuard() = default;
    explicit ThreadGuard(std::thread&& t_) : t(std::move(t_)) {}
    ThreadGuard(const ThreadGuard&) = delete;
    ThreadGuard& operator=(const ThreadGuard&) = delete;
    ThreadGuard(ThreadGuard&& other) noexcept : t(std::move(other.t)) {}
    ThreadGuard& operator=(ThreadGuard&&) = delete;
    ~ThreadGuard() {
        if (t.joinable())
            t.join();
    }
};

/**
 * @brief Set of threads joined together when the group goes out of scope.
 */
class ThreadGroup {
  public:
    template <class Fn> void spawn(Fn&& fn) { threads_.emplace_back(std::thread(std::forward<Fn>(fn))); }

    void join_all() { threads_.clear(); }

    std::size_t size() const { return threads_.size(); }

  private:
    std::vector<ThreadGuard> threads_;
};

#endif // THREAD_UTILS_HPP
