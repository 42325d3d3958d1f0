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


// Catch includes
#include <catch2/catch_test_macros.hpp>

// compgraph includes
#include <compgraph/graph.hpp>
#include <tests/utils/catch.hpp>

// Standard includes
#include <sstream>
#include <string>
#include <vector>

using namespace compgraph;

namespace {

template<typename T>
std::string str(const T& value)
{
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace

TEST_CASE("testing syntax assistants", "[graph][assistants]")
{
    Graph<double> graph;
    auto a = graph.variable();
    auto b = graph.variable();
    auto c = graph.constant(0.5);

    SECTION("testing handle addition builds a single sum")
    {
        Terms terms = a + b + c;
        REQUIRE(terms.handles.size() == 3);
        CHECK(terms.handles[0] == a);
        CHECK(terms.handles[2] == c);

        auto s = graph.append(terms);
        CHECK(graph.size() == 4);
        CHECK(str(graph[s]) == "Sum(#0, #1, #2)");
        CHECK(evaluate(graph, { { a, 1.0 }, { b, 2.0 } }).at(s) == approx(3.5));
    }

    SECTION("testing handle multiplication builds a single product")
    {
        auto p = graph.append(a * b * c);
        CHECK(str(graph[p]) == "Product(#0, #1, #2)");
        CHECK(evaluate(graph, { { a, 4.0 }, { b, 3.0 } }).at(p) == approx(6.0));
    }

    SECTION("testing repeated handles are kept")
    {
        auto s = graph.append(a + a);
        CHECK(graph[s].children().size() == 2);
        CHECK(evaluate(graph, { { a, 1.25 }, { b, 0.0 } }).at(s) == approx(2.5));
    }

    SECTION("testing wrt collects handles")
    {
        CHECK(wrt().empty());
        CHECK(wrt(a).size() == 1);
        CHECK(wrt(a, b, a).size() == 2);
        CHECK(wrt(a, b).count(b) == 1);
        CHECK(wrt(a, b).count(c) == 0);
    }
}

TEST_CASE("testing node output", "[graph][output]")
{
    Graph<double> graph;
    auto x = graph.variable();
    auto k = graph.constant(2.5);
    auto s = graph.sum({ x, k });
    auto p = graph.append(x * k);
    auto dp = derivative(graph, p, wrt(x));

    CHECK(str(graph[x]) == "Variable");
    CHECK(str(graph[k]) == "Constant(2.5)");
    CHECK(str(graph[s]) == "Sum(#0, #1)");
    CHECK(str(graph[p]) == "Product(#0, #1)");
    CHECK(str(graph[dp.handle]) == "SumOfProducts([#4 * #1] + [#0 * #5])");
    CHECK(str(graph[graph.sum({})]) == "Sum()");
    CHECK(str(SumOfProducts<double>(std::vector<SumOfProducts<double>::Term>{})) == "SumOfProducts()");
}
