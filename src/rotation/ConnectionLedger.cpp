#include "proxygate/rotation/ConnectionLedger.hpp"

#include <algorithm>

namespace proxygate::rotation {

ConnectionLedger::ConnectionLedger(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void ConnectionLedger::append(model::ConnectionRecord record) {
    records_.push_back(std::move(record));
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

std::vector<model::ConnectionRecord> ConnectionLedger::snapshot() const {
    return {records_.begin(), records_.end()};
}

} // namespace proxygate::rotation
