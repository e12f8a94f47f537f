#ifndef PHISCRUB_PIPELINE_BATCH_RUNNER_HPP
#define PHISCRUB_PIPELINE_BATCH_RUNNER_HPP

#include <algorithm>
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/deid_config.hpp"
#include "pipeline/deidentifier.hpp"
#include "util/logger.hpp"

/**
 * @file batch_runner.hpp
 * @brief De-identifies many documents concurrently on a fixed set of worker
 *        threads sharing one Deidentifier.
 *
 * Usage Example:
 *  @code
 *    phiscrub::pipeline::Deidentifier engine;
 *    phiscrub::pipeline::BatchRunner runner(engine, 4);
 *    auto pending = runner.submit("SSN: 123-45-6789", phiscrub::config::DeidentifyConfig());
 *    std::cout << pending.get().deidentifiedText << std::endl;
 *  @endcode
 */

namespace phiscrub {
namespace pipeline {

/// One document with its own request settings.
struct BatchItem
{
    std::string text;
    config::DeidentifyConfig request;
};

/**
 * @class BatchRunner
 * @brief Fixed-size worker pool dedicated to Deidentifier::deidentify.
 *
 * - The Deidentifier is borrowed and must outlive the runner.
 * - A document that fails stores its exception in its own future only.
 * - The destructor finishes every queued document before joining.
 */
class BatchRunner
{
public:
    /**
     * @param engine      Shared pipeline; only its const deidentify() is used.
     * @param threadCount Number of workers. If zero, uses hardware concurrency.
     */
    explicit BatchRunner(const Deidentifier &engine, std::size_t threadCount = 0)
        : engine_(engine), stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    Job job;
                    {
                        std::unique_lock<std::mutex> lock(queueMutex_);
                        condVar_.wait(lock, [this] {
                            return !jobs_.empty() || stop_;
                        });

                        if (stop_ && jobs_.empty()) {
                            return;
                        }
                        job = std::move(jobs_.front());
                        jobs_.pop();
                    }
                    run(job);
                }
            });
        }
        util::logger::debug("BatchRunner: started " + std::to_string(threadCount) + " workers");
    }

    ~BatchRunner()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    BatchRunner(const BatchRunner &) = delete;
    BatchRunner& operator=(const BatchRunner &) = delete;

    /**
     * @brief Queue one document.
     * @return Future holding the result, or the exception deidentify() threw.
     */
    std::future<DeidentifyResult> submit(const std::string &text, const config::DeidentifyConfig &request)
    {
        Job job;
        job.item.text = text;
        job.item.request = request;
        std::future<DeidentifyResult> res = job.promise.get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("submit on stopped BatchRunner");
            }
            jobs_.push(std::move(job));
        }
        condVar_.notify_one();
        return res;
    }

    /**
     * @brief Queue every item and return their futures in submission order.
     */
    std::vector<std::future<DeidentifyResult>> submitAll(const std::vector<BatchItem> &items)
    {
        std::vector<std::future<DeidentifyResult>> futures;
        futures.reserve(items.size());
        for (const auto &item : items) {
            futures.push_back(submit(item.text, item.request));
        }
        return futures;
    }

    std::size_t threadCount() const { return workers_.size(); }

private:
    struct Job
    {
        BatchItem item;
        std::promise<DeidentifyResult> promise;
    };

    void run(Job &job) const
    {
        try {
            job.promise.set_value(engine_.deidentify(job.item.text, job.item.request));
        }
        catch (const std::exception &ex) {
            util::logger::warn(std::string("BatchRunner: document failed: ") + ex.what());
            job.promise.set_exception(std::current_exception());
        }
    }

    const Deidentifier &engine_;
    std::vector<std::thread> workers_;
    std::queue<Job> jobs_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace pipeline
} // namespace phiscrub

#endif // PHISCRUB_PIPELINE_BATCH_RUNNER_HPP
