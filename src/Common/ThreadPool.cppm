// @file ThreadPool.cppm
// @brief 独立したジョブ（1ファイルの検証など）を並列に実行するワーカープール。

module;
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

export module jvalid.common.thread_pool;

namespace jvalid::common {

/// @brief 固定数のワーカースレッドでジョブを先着順に実行するプール。
/// @note 破棄時は受け付け済みのジョブをすべて実行してからスレッドを終了する。
export class ThreadPool {
public:
    /// @brief ハードウェアの並列度（取得できない場合は2）。
    static std::size_t defaultThreadCount() {
        const std::size_t n = std::thread::hardware_concurrency();
        return n == 0 ? 2 : n;
    }

    /// @brief ワーカースレッドを起動する。
    /// @param threadCount スレッド数。0ならdefaultThreadCount()。
    explicit ThreadPool(std::size_t threadCount = 0) {
        if (threadCount == 0) {
            threadCount = defaultThreadCount();
        }
        workers_.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { runWorker(); });
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shuttingDown_ = true;
        }
        jobAvailable_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    // コピー・ムーブ禁止
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief ジョブを登録する。
    /// @param job 引数なしで呼び出せるオブジェクト。
    /// @return ジョブの戻り値を受け取るfuture。ジョブが送出した例外はget()で再送出される。
    template <class F>
    auto enqueue(F&& job) -> std::future<std::invoke_result_t<F>> {
        using Result = std::invoke_result_t<F>;

        // std::functionはコピー可能な呼び出し対象を要求するためshared_ptrで包む
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(job));
        auto future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shuttingDown_) {
                throw std::runtime_error("ThreadPool: pool is shutting down");
            }
            jobs_.emplace_back([task] { (*task)(); });
        }
        jobAvailable_.notify_one();
        return future;
    }

    /// @brief 入力の各要素にfnを並列適用し、結果を入力と同じ順序で返す。
    /// @note いずれかのfnが例外を送出した場合、入力順で最初のものを再送出する。
    template <class T, class F>
    auto map(const std::vector<T>& inputs, F fn) -> std::vector<std::invoke_result_t<F&, const T&>> {
        using Result = std::invoke_result_t<F&, const T&>;

        std::vector<std::future<Result>> futures;
        futures.reserve(inputs.size());
        for (const auto& input : inputs) {
            futures.push_back(enqueue([&fn, &input] { return fn(input); }));
        }
        // ジョブはfnとinputsを参照するため、例外を再送出する前に全ジョブの完了を待つ
        for (auto& future : futures) {
            future.wait();
        }
        std::vector<Result> results;
        results.reserve(inputs.size());
        for (auto& future : futures) {
            results.push_back(future.get());
        }
        return results;
    }

    /// @brief ワーカースレッドの数。
    std::size_t getThreadCount() const { return workers_.size(); }

private:
    void runWorker() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                jobAvailable_.wait(lock, [this] { return shuttingDown_ || !jobs_.empty(); });
                if (jobs_.empty()) {
                    return;  // 停止要求があり、残りのジョブもない
                }
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            job();
        }
    }

    std::vector<std::thread> workers_;          ///< ワーカースレッド
    std::deque<std::function<void()>> jobs_;    ///< 未実行のジョブ（先着順）
    std::mutex mutex_;                          ///< jobs_とshuttingDown_を保護する
    std::condition_variable jobAvailable_;      ///< ジョブの登録・停止要求の通知
    bool shuttingDown_ = false;                 ///< trueなら新しいジョブを受け付けない
};

}  // namespace jvalid::common
