#include "lazyseq/lazyseq.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace ls = lazyseq;


template <class A, class B>
std::ostream& operator << (std::ostream& s, const std::pair<A, B>& p)
{
    return s << '(' << p.first << ", " << p.second << ')';
}
template <class T>
std::ostream& operator << (std::ostream& s, const std::vector<T>& v)
{
    s << '[';
    const char* sep = "";
    for (const auto& x : v) {
        s << std::exchange(sep, ", ") << x;
    }
    return s << ']';
}


// Endless source of random numbers in [0, 100]
auto random_numbers()
{
    return ls::generator<int>([engine = std::mt19937{std::random_device{}()},
                               distribution = std::uniform_int_distribution<int>{0, 100}] (auto output) mutable {
        output(distribution(engine));
        return true;
    });
}

void numbers_example()
{
    const auto numbers = ls::sequence(std::vector{1, 2, 3})
            .push(4, 5, 6)
            .concat(random_numbers())
            .filter([] (int x) { return x != 10; })
            .replace(7, 0)
            .take(100)
            .drop(3)          // removes 2 elements
            .take_last(50)
            .drop_last(2);

    ls::debug_print(std::cout, numbers);
    std::cout << numbers.join("; ") << '\n';
}

void hello_example()
{
    const auto hello = ls::sequence(std::vector<std::string>{"hello", "world", "!"})
            .filter([] (const std::string& s) { return s.find('o') != std::string::npos; })
            .map([] (std::string s) {
                std::transform(s.begin(), s.end(), s.begin(), [] (unsigned char c) {
                    return static_cast<char>(std::toupper(c));
                });
                return s;
            })
            .entries()
            .collect();
    // [(HELLO, 0), (WORLD, 1)]
    std::cout << hello << '\n';
}

void flatten_example()
{
    using node = ls::nested<std::string>;
    auto group = [] (std::initializer_list<node> children) {
        return ls::nest<std::string>(children);
    };

    ls::sequence<node>({
        "hello",
        group({group({group({" "})}), "w", group({"o"}), "r"}),
        group({group({group({"l"}), "d"})}),
        "!"
    })
            .flatten(2)
            .for_each([] (const node& x) {
                if (x.is_leaf()) {
                    std::cout << std::quoted(x.leaf()) << '\n';
                }
                else {
                    std::cout << "<nested>\n";
                }
            })
            .consume();
}

ls::pull_sequence<int> round_odd_up(const ls::pull_sequence<int>& upstream)
{
    return ls::map(upstream, [] (int x) { return x % 2 == 0 ? x : x + 1; });
}

void pipe_example()
{
    const auto odds = ls::sequence(std::vector{1, 2, 3, 4, 5, 6, 7, 8})
            .pipe(round_odd_up)
            .collect();
    // [2, 2, 4, 4, 6, 6, 8, 8]
    std::cout << odds << '\n';
}


int main()
{
    numbers_example();
    hello_example();
    flatten_example();
    pipe_example();

    // Nothing is evaluated until a terminal operation
    const auto squares = ls::sequence(ls::iota(1))
            .map([] (int x) { return x * x; })
            .filter([] (int x) { return x % 3 == 1; });
    std::cout << squares.take(5).join(", ") << '\n';
    std::cout << squares.find([] (int x) { return x > 1000; }).value_or(-1) << '\n';

    return 0;
}
