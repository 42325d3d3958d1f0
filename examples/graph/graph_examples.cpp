// compgraph
//
// computation graphs with symbolic differentiation in C++
//
// Licensed under the MIT License <http://opensource.org/licenses/MIT>.
//
// Copyright © 2025–2025
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.


// C++ includes
#include <iostream>
#include <vector>

// compgraph includes
#include <compgraph/graph.hpp>

using namespace compgraph;

void demonstrate_evaluate_and_derivative() {
    std::cout << "=== 1. Evaluate and differentiate c = 1 + b ===\n";

    Graph_d graph;
    auto a = graph.constant(1.0);
    auto b = graph.variable();
    auto c = graph.append(a + b);

    auto values = evaluate(graph, { { b, 2.0 } });
    std::cout << "c = " << values.at(c) << std::endl;

    auto dc = derivative(graph, c, wrt(b));
    auto dvalues = evaluate(graph, dc.subgraph, {});
    std::cout << "dc/db = " << dvalues.at(dc.handle) << std::endl;

    std::cout << "graph:\n" << graph;
}

void demonstrate_products() {
    std::cout << "\n=== 2. Products and partial derivatives ===\n";

    Graph_d graph;
    auto x = graph.variable();
    auto y = graph.variable();
    auto xy = graph.append(x * y);
    auto f = graph.append(xy + x + y);  // f = x*y + x + y

    auto partials = partial_derivatives(graph, f, { x, y });

    auto values = evaluate(graph, { { x, 3.0 }, { y, 4.0 } });
    std::cout << "f = " << values.at(f) << std::endl;
    std::cout << "df/dx = " << values.at(partials[0].handle) << std::endl;
    std::cout << "df/dy = " << values.at(partials[1].handle) << std::endl;
    std::cout << "Graph has " << graph.size() << " nodes\n";
}

void demonstrate_higher_order() {
    std::cout << "\n=== 3. Higher-order derivatives of x^3 ===\n";

    Graph_d graph;
    auto x = graph.variable();
    auto f = graph.append(x * x * x);

    std::vector<NodeHandle> orders{ f };
    for(int i = 0; i < 3; ++i)
        orders.push_back(derivative(graph, orders.back(), wrt(x)).handle);

    auto values = evaluate(graph, { { x, 2.0 } });
    for(size_t i = 0; i < orders.size(); ++i)
        std::cout << "d^" << i << "f/dx^" << i << " = " << values.at(orders[i]) << std::endl;
}

void demonstrate_shared_subgraphs() {
    std::cout << "\n=== 4. Shared subgraphs ===\n";

    // Node k sums every previous node: 2^(N-2) paths from x to the last node
    const int N = 40;
    Graph_d graph;
    auto x = graph.variable();
    std::vector<NodeHandle> previous{ x };
    for(int k = 1; k < N; ++k)
        previous.push_back(graph.sum(previous));

    auto dlast = derivative(graph, previous.back(), wrt(x));
    auto cone = ancestors(graph, dlast.handle);
    auto values = evaluate(graph, cone, {});
    std::cout << "paths from x to the last node = " << values.at(dlast.handle) << std::endl;
    std::cout << "derivative cone has " << cone.size() << " nodes\n";
}

int main() {
    demonstrate_evaluate_and_derivative();
    demonstrate_products();
    demonstrate_higher_order();
    demonstrate_shared_subgraphs();
    return 0;
}
