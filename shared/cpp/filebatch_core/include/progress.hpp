#pragma once
#include <cstddef>
#include <mutex>
#include <ostream>
#include <string>

// Receives "n more of total completed" notifications.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void add_total(std::size_t n) = 0;
    virtual void advance(std::size_t n) = 0;
};

// Writes `[task] done/total (pct%)` lines to a stream.
class ConsoleProgress : public ProgressSink {
public:
    ConsoleProgress(std::string task_name, std::ostream& out);

    void add_total(std::size_t n) override;
    void advance(std::size_t n) override;

    std::size_t done() const;
    std::size_t total() const;

private:
    std::string task_;
    std::ostream& out_;
    mutable std::mutex mtx_;
    std::size_t done_{0};
    std::size_t total_{0};
};
