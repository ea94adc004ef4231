#pragma once
#include <vector>
#include <cstddef>
#include <exception>
#include <type_traits>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>

namespace seiscat {

    // Apply fn to every input on a bounded pool and collect the results by
    // input index, so the output order never depends on scheduling.
    // threads <= 1 runs inline on the calling thread.
    template <typename In, typename Fn>
    auto parallel_map(const std::vector<In>& inputs, unsigned threads, Fn fn)
        -> std::vector<std::invoke_result_t<Fn&, const In&>> {
        using Out = std::invoke_result_t<Fn&, const In&>;
        // std::vector<bool> packs bits, concurrent writes to neighbours would race
        static_assert(!std::is_same_v<Out, bool>, "parallel_map cannot collect bool results");
        std::vector<Out> results(inputs.size());
        if (threads <= 1 || inputs.size() <= 1) {
            for (std::size_t i = 0; i < inputs.size(); ++i) results[i] = fn(inputs[i]);
            return results;
        }

        std::vector<std::exception_ptr> errors(inputs.size());
        {
            boost::asio::thread_pool pool(threads);
            for (std::size_t i = 0; i < inputs.size(); ++i) {
                boost::asio::post(pool, [&, i]() {
                    try {
                        results[i] = fn(inputs[i]);
                    } catch (...) {
                        errors[i] = std::current_exception();
                    }
                });
            }
            pool.join();
        }
        for (auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
        return results;
    }
} // namespace seiscat
