#pragma once

#include "lazyseq/generator.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace lazyseq::test {

// Single-use infinite source counting from 0, remembers how many values were pulled out of it
struct counting_generator
{
    std::shared_ptr<std::size_t> pulled = std::make_shared<std::size_t>(0);

    auto sequence() const
    {
        return lazyseq::generator<int>([pulled = pulled] (auto output) {
            output(static_cast<int>((*pulled)++));
            return true;
        });
    }
};

// Records every callback invocation
struct call_log
{
    std::vector<int> calls;

    auto recorder()
    {
        return [this] (int x) {
            calls.push_back(x);
        };
    }
};

} // namespace lazyseq::test
