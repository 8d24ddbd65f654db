#include "../include/progress.hpp"

ConsoleProgress::ConsoleProgress(std::string task_name, std::ostream& out)
    : task_(std::move(task_name)), out_(out) {}

void ConsoleProgress::add_total(std::size_t n) {
    std::lock_guard<std::mutex> lock(mtx_);
    total_ += n;
}

void ConsoleProgress::advance(std::size_t n) {
    std::lock_guard<std::mutex> lock(mtx_);
    done_ += n;
    if (done_ > total_) total_ = done_;
    std::size_t pct = total_ == 0 ? 100 : done_ * 100 / total_;
    out_ << "[" << task_ << "] " << done_ << "/" << total_ << " (" << pct << "%)" << std::endl;
}

std::size_t ConsoleProgress::done() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return done_;
}

std::size_t ConsoleProgress::total() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return total_;
}
