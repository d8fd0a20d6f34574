#include <arbor/arbor.hpp>
#include <iostream>

using namespace arbor;

int main() {
    // Build a symbolic expression
    auto x = input("x", DType::Float64, 2);
    auto b = input("b", DType::Float64, 1);
    auto y = tanh(x * 2.0 + b) + 0.0;
    auto total = sum(y, {1});

    // Compile it and show what the optimizer produced
    auto f = function({x, b}, {y, total});
    std::cout << f.graph().str() << std::endl;

    auto xv = Tensor::from_vector<double>({0.1, 0.2, 0.3, 0.4, 0.5, 0.6}, {2, 3});
    auto bv = Tensor::from_vector<double>({0.0, -0.5, 0.5});
    auto out = f({xv, bv});
    std::cout << out[0].repr() << std::endl;
    std::cout << out[1].repr() << std::endl;

    // Shared state updated after every call
    auto w = shared(Tensor::zeros({3}), "w");
    auto step = function({b}, {w * 1.0}, {{w, w + b}});
    for (int i = 0; i < 3; ++i)
        std::cout << "w before step " << i << ": " << step({bv})[0].repr()
                  << std::endl;
    std::cout << "w after: " << w.get_value().repr() << std::endl;

    // Per-node timing
    profile::enable();
    f({xv, bv});
    profile::disable();
    std::cout << profile::dump() << std::endl;

    return 0;
}
