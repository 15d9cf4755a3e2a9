#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace yomikata {

// Lazily enumerates the ways to cut a sequence into a fixed number of contiguous,
// non-empty groups. Cut positions are produced in lexicographic order, so the
// partitions with the leftmost cuts come first.
class PartitionGenerator {
public:
    PartitionGenerator(std::vector<std::string> items, std::size_t groups);

    // Writes the next partition into out; returns false once exhausted
    bool next(std::vector<std::vector<std::string>>& out);

    // Number of partitions handed out so far
    std::size_t produced() const { return produced_; }

private:
    std::vector<std::string> items_;
    std::size_t groups_;
    std::vector<std::size_t> cuts_;
    bool started_ = false;
    bool done_ = false;
    std::size_t produced_ = 0;

    bool advance();
};

} // namespace yomikata
