#include "yomikata/partitions.h"

#include <utility>

namespace yomikata {

PartitionGenerator::PartitionGenerator(std::vector<std::string> items, std::size_t groups)
    : items_(std::move(items)), groups_(groups) {
    if (groups_ == 0 || groups_ > items_.size()) {
        done_ = true;
    }
}

bool PartitionGenerator::advance() {
    const std::size_t n = items_.size();
    const std::size_t k = cuts_.size();
    if (!started_) {
        started_ = true;
        for (std::size_t i = 0; i < k; ++i) {
            cuts_[i] = i + 1;
        }
        return true;
    }
    // Rightmost cut that can still move right
    std::size_t i = k;
    while (i > 0) {
        --i;
        if (cuts_[i] < n - k + i) {
            ++cuts_[i];
            for (std::size_t j = i + 1; j < k; ++j) {
                cuts_[j] = cuts_[j - 1] + 1;
            }
            return true;
        }
    }
    return false;
}

bool PartitionGenerator::next(std::vector<std::vector<std::string>>& out) {
    if (done_) {
        return false;
    }
    if (!started_) {
        cuts_.assign(groups_ - 1, 0);
    }
    if (!advance()) {
        done_ = true;
        return false;
    }
    if (cuts_.empty()) {
        // A single group has exactly one partition
        done_ = true;
    }

    out.clear();
    out.reserve(groups_);
    std::size_t start = 0;
    for (std::size_t g = 0; g < groups_; ++g) {
        std::size_t end = g < cuts_.size() ? cuts_[g] : items_.size();
        out.emplace_back(items_.begin() + static_cast<std::ptrdiff_t>(start),
                         items_.begin() + static_cast<std::ptrdiff_t>(end));
        start = end;
    }
    ++produced_;
    return true;
}

} // namespace yomikata
