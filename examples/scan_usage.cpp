#include <arbor/arbor.hpp>
#include <iostream>

using namespace arbor;

int main() {
    // A ** k by repeated multiplication
    auto A = input("A", DType::Float64, 1);
    auto k = input("k", DType::Int64, 0);
    ScanSpec power;
    power.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] * p[1]};
    };
    power.outputs_info = {OutputInfo(ones_like(A))};
    power.non_sequences = {A};
    power.n_steps = k;
    power.name = "power";
    auto pow_f =
        function({A, k}, {subtensor(scan(power).outputs[0], 0, -1)});

    auto a = Tensor::arange(10).astype(DType::Float64);
    std::cout << "A**3 = "
              << pow_f({a, Tensor::scalar<int64_t>(3)})[0].repr()
              << std::endl;

    // Polynomial evaluation: sum_i c_i * x**i
    auto coefficients = input("coefficients", DType::Float64, 1);
    auto x = input("x", DType::Float64, 0);
    auto terms = scan_map(
        [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
            return {p[0] * pow(p[2], p[1])};
        },
        {coefficients, constant(Tensor::arange(1000))}, {x}, "polynomial");
    auto poly = function({coefficients, x}, {sum(terms.outputs[0])});
    std::cout << "1 + 2x^2 at x=3: "
              << poly({Tensor::from_vector<double>({1, 0, 2}),
                       Tensor::scalar<double>(3.0)})[0]
                     .item<double>()
              << std::endl;

    // Fibonacci with two output taps
    auto init = input("init", DType::Float64, 1);
    ScanSpec fib;
    fib.fn = [](const std::vector<Variable> &p) -> std::vector<ScanReturn> {
        return {p[0] + p[1]};
    };
    fib.outputs_info = {OutputInfo(init, {-2, -1})};
    fib.n_steps = constant(10);
    fib.name = "fibonacci";
    auto fib_f = function({init}, {scan(fib).outputs[0]});
    std::cout << "fibonacci: "
              << fib_f({Tensor::from_vector<double>({0, 1})})[0].repr()
              << std::endl;

    // Counting steps in a shared variable
    auto counter = shared(Tensor::scalar<int64_t>(0), "counter");
    ScanSpec count;
    count.fn = [&](const std::vector<Variable> &) -> std::vector<ScanReturn> {
        return {Updates{{counter, counter + 1.0}}};
    };
    count.n_steps = constant(10);
    auto tick = function({}, {}, scan(count).updates);
    tick({});
    tick({});
    std::cout << "counter after two calls: "
              << counter.get_value().item<int64_t>() << std::endl;

    return 0;
}
