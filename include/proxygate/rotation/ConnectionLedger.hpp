#pragma once

#include "proxygate/model/ConnectionRecord.hpp"

#include <cstddef>
#include <deque>
#include <vector>

namespace proxygate::rotation {

// Most recent forwarding records for one identity, oldest evicted first.
class ConnectionLedger {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit ConnectionLedger(std::size_t capacity = kDefaultCapacity);

    void append(model::ConnectionRecord record);
    std::size_t size() const noexcept { return records_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }
    std::vector<model::ConnectionRecord> snapshot() const;

private:
    std::size_t capacity_;
    std::deque<model::ConnectionRecord> records_;
};

} // namespace proxygate::rotation
