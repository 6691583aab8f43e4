#pragma once

#include <llvm/ADT/ScopeExit.h>

#include <algorithm>
#include <future>
#include <memory>
#include <semaphore>
#include <type_traits>
#include <vector>

namespace fixpoint {

// Runs fn(item) for every item on its own task, at most `maxWorkers` at a
// time. Futures come back in input order; an exception thrown by fn is
// rethrown by that item's future and does not hold on to its worker slot.
// `items` must outlive the returned futures.
template <typename Item, typename Fn>
auto runBounded(const std::vector<Item> &items, unsigned maxWorkers, Fn fn)
    -> std::vector<std::future<std::invoke_result_t<Fn &, const Item &>>> {
    using Result = std::invoke_result_t<Fn &, const Item &>;

    auto sem = std::make_shared<std::counting_semaphore<>>(std::max(1u, maxWorkers));
    std::vector<std::future<Result>> futures;
    futures.reserve(items.size());
    for (const Item &item : items) {
        futures.push_back(std::async(std::launch::async, [sem, fn, &item]() mutable {
            sem->acquire();
            auto release = llvm::make_scope_exit([&sem] { sem->release(); });
            return fn(item);
        }));
    }
    return futures;
}

} // namespace fixpoint
