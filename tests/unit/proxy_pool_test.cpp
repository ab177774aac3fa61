#include "proxygate/proxy/ProxyPool.hpp"
#include "proxygate/util/Errors.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using proxygate::model::ProxyDescriptor;
using proxygate::proxy::ProxyPool;
using proxygate::util::ErrorCode;
using proxygate::util::GatewayError;

ProxyDescriptor MakeProxy(int n) {
    return ProxyDescriptor{"10.0.0." + std::to_string(n), static_cast<std::uint16_t>(8000 + n),
                           "user" + std::to_string(n), "pass" + std::to_string(n)};
}

template <class Fn>
ErrorCode CaptureError(Fn&& fn) {
    try {
        fn();
    } catch (const GatewayError& ex) {
        return ex.code();
    }
    assert(false && "expected GatewayError");
    return ErrorCode::internal_error;
}

void TestAddPreservesInsertionOrder() {
    ProxyPool pool;
    assert(pool.add(MakeProxy(0)) == 1);
    assert(pool.add(MakeProxy(1)) == 2);
    assert(pool.add(MakeProxy(2)) == 3);

    auto listed = pool.list();
    assert(listed.size() == 3);
    assert(listed[0].host == "10.0.0.0");
    assert(listed[2].port == 8002);
    assert(listed[1].user == "user1");
}

void TestAddRejectsDuplicateHostPort() {
    ProxyPool pool;
    pool.add(MakeProxy(0));
    auto duplicate = MakeProxy(0);
    duplicate.user = "someone-else";

    assert(CaptureError([&] { pool.add(duplicate); }) == ErrorCode::duplicate_proxy);
    assert(pool.snapshotLength() == 1);
}

void TestRemoveMissingLeavesPoolUnchanged() {
    ProxyPool pool;
    pool.add(MakeProxy(0));
    pool.add(MakeProxy(1));

    assert(CaptureError([&] { pool.remove("10.0.0.9", 8009); }) == ErrorCode::proxy_not_found);
    assert(CaptureError([&] { pool.remove("10.0.0.0", 8001); }) == ErrorCode::proxy_not_found);
    assert(pool.snapshotLength() == 2);

    assert(pool.remove("10.0.0.0", 8000) == 1);
    assert(pool.list().front().host == "10.0.0.1");
}

void TestClearReportsPriorSize() {
    ProxyPool pool({MakeProxy(0), MakeProxy(1), MakeProxy(2)});
    assert(pool.clear() == 3);
    assert(pool.snapshotLength() == 0);
    assert(pool.clear() == 0);
}

void TestSelectionWrapsModuloCurrentLength() {
    ProxyPool pool({MakeProxy(0), MakeProxy(1), MakeProxy(2)});

    auto selection = pool.selectAt(5);
    assert(selection);
    assert(selection->proxy.host == "10.0.0.2");
    assert(selection->index == 2);
    assert(selection->total == 3);

    auto advance = pool.advanceFrom(5);
    assert(advance);
    assert(advance->from.host == "10.0.0.2");
    assert(advance->to.host == "10.0.0.0");
    assert(advance->index == 0);
}

void TestEmptyPoolSelectsNothing() {
    ProxyPool pool;
    assert(!pool.selectAt(0));
    assert(!pool.advanceFrom(0));
}

void TestReplaceDropsDuplicates() {
    ProxyPool pool({MakeProxy(7)});
    auto kept = pool.replace({MakeProxy(0), MakeProxy(1), MakeProxy(0)});
    assert(kept == 2);
    auto listed = pool.list();
    assert(listed.size() == 2);
    assert(listed[0].host == "10.0.0.0");
    assert(listed[1].host == "10.0.0.1");
}

void TestConcurrentMutationAndSelection() {
    ProxyPool pool({MakeProxy(0)});
    std::atomic<bool> stop{false};
    std::atomic<int> selections{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&, r] {
            std::size_t index = static_cast<std::size_t>(r) * 7;
            while (!stop.load()) {
                if (auto selection = pool.selectAt(index++)) {
                    assert(selection->index < selection->total);
                    ++selections;
                }
            }
        });
    }

    for (int round = 0; round < 2000; ++round) {
        int n = 1 + round % 5;
        try {
            pool.add(MakeProxy(n));
        } catch (const GatewayError&) {
        }
        if (round % 3 == 0) {
            try {
                pool.remove("10.0.0." + std::to_string(n), static_cast<std::uint16_t>(8000 + n));
            } catch (const GatewayError&) {
            }
        }
        if (round % 250 == 0) {
            pool.replace({MakeProxy(0)});
        }
    }
    while (selections.load() == 0) {
        std::this_thread::yield();
    }
    stop = true;
    for (auto& reader : readers) {
        reader.join();
    }
    assert(selections.load() > 0);
}

} // namespace

int main() {
    TestAddPreservesInsertionOrder();
    TestAddRejectsDuplicateHostPort();
    TestRemoveMissingLeavesPoolUnchanged();
    TestClearReportsPriorSize();
    TestSelectionWrapsModuloCurrentLength();
    TestEmptyPoolSelectsNothing();
    TestReplaceDropsDuplicates();
    TestConcurrentMutationAndSelection();

    std::cout << "proxygate_unit_proxy_pool: pass\n";
    return 0;
}
