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
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace compgraph;

namespace {

// Node kind defined outside the library: twice the value of its only child
class Twice : public Node<double>
{
  public:
    explicit Twice(NodeHandle child)
        : child_(child)
    {}

    double value(NodeHandle /*self*/, const ValueMap<double>& values) const override
    {
        return 2.0 * values.at(child_);
    }

    std::unique_ptr<Node<double>> derivative(NodeHandle /*self*/, const HandleSet& /*wrt*/, const DerivativeMap& derivatives) const override
    {
        return std::make_unique<Twice>(derivatives.at(child_));
    }

    const char* kind() const override { return "Twice"; }

    std::vector<NodeHandle> children() const override { return { child_ }; }

  private:
    NodeHandle child_;
};

} // namespace

TEST_CASE("testing Graph construction", "[graph]")
{
    Graph<double> graph;
    CHECK(graph.empty());
    CHECK(graph.size() == 0);
    CHECK(graph.full_subgraph().empty());

    auto a = graph.constant(1.5);
    auto b = graph.variable();
    auto c = graph.sum({ a, b });

    CHECK_FALSE(graph.empty());
    CHECK(graph.size() == 3);

    SECTION("testing lookup returns the appended node")
    {
        CHECK(std::string(graph[a].kind()) == "Constant");
        CHECK(std::string(graph[b].kind()) == "Variable");
        CHECK(std::string(graph.at(c).kind()) == "Sum");

        const auto* constant = dynamic_cast<const Constant<double>*>(&graph[a]);
        REQUIRE(constant != nullptr);
        CHECK(constant->constant() == 1.5);
    }

    SECTION("testing children are kept in order")
    {
        auto children = graph[c].children();
        REQUIRE(children.size() == 2);
        CHECK(children[0] == a);
        CHECK(children[1] == b);
        CHECK(graph[a].children().empty());
        CHECK(graph[b].children().empty());
    }

    SECTION("testing full subgraph covers every handle in ascending order")
    {
        auto subgraph = graph.full_subgraph();
        REQUIRE(subgraph.size() == 3);
        CHECK(subgraph[0] == a);
        CHECK(subgraph[1] == b);
        CHECK(subgraph[2] == c);
        CHECK(is_topological(graph, subgraph));
    }

    SECTION("testing handle() returns handles of existing positions")
    {
        CHECK(graph.handle(0) == a);
        CHECK(graph.handle(2) == c);
        CHECK_THROWS_AS(graph.handle(3), std::out_of_range);
    }

    SECTION("testing appending never invalidates earlier handles")
    {
        for(int i = 0; i < 1000; ++i)
            graph.sum({ a, c });
        CHECK(graph.size() == 1003);
        CHECK(std::string(graph[a].kind()) == "Constant");
        CHECK(graph[c].children()[1] == b);
    }

    SECTION("testing push() of a node kind value")
    {
        auto d = graph.push(Sum<double>(std::vector<NodeHandle>{ c, c }));
        auto e = graph.push(Constant<double>(4.0));
        CHECK(d.index() == 3);
        CHECK(e.index() == 4);
        CHECK(std::string(graph[d].kind()) == "Sum");
    }

    SECTION("testing a null node is rejected")
    {
        CHECK_THROWS_AS(graph.append(nullptr), std::invalid_argument);
        CHECK(graph.size() == 3);
    }

    SECTION("testing reserve keeps the content")
    {
        graph.reserve(100);
        CHECK(graph.size() == 3);
        CHECK(graph.at(c).children().size() == 2);
    }
}

TEST_CASE("testing Graph with a user-defined node kind", "[graph][extension]")
{
    Graph<double> graph;
    auto x = graph.variable();
    auto y = graph.append(std::make_unique<Twice>(x));
    auto z = graph.push(Twice(y));

    auto values = evaluate(graph, { { x, 1.5 } });
    CHECK(values.at(y) == approx(3.0));
    CHECK(values.at(z) == approx(6.0));

    auto dz = derivative(graph, z, wrt(x));
    auto dvalues = evaluate(graph, dz.subgraph, {});
    CHECK(dvalues.at(dz.handle) == approx(4.0));
    CHECK(std::string(graph[dz.handle].kind()) == "Twice");
}

TEST_CASE("testing Graph move", "[graph]")
{
    Graph<double> graph;
    auto a = graph.constant(2.0);
    auto b = graph.sum({ a, a });

    Graph<double> moved = std::move(graph);
    REQUIRE(moved.size() == 2);
    CHECK(evaluate(moved, {}).at(b) == approx(4.0));
}

TEST_CASE("testing Graph output", "[graph]")
{
    Graph<double> graph;
    auto a = graph.constant(1);
    auto b = graph.variable();
    graph.sum({ a, b });

    std::ostringstream out;
    out << graph;
    CHECK(out.str() == "#0 = Constant(1)\n#1 = Variable\n#2 = Sum(#0, #1)\n");
}

#if COMPGRAPH_HANDLE_CHECKS
TEST_CASE("testing foreign handles are rejected", "[graph][checks]")
{
    Graph<double> first;
    Graph<double> second;
    auto a = first.constant(1.0);
    auto b = first.variable();
    second.constant(3.0);
    second.constant(4.0);

    CHECK_THROWS_AS(second.at(a), std::invalid_argument);
    CHECK_THROWS_AS(second.check(b), std::invalid_argument);
    CHECK_THROWS_AS(second.sum({ a, b }), std::invalid_argument);
    CHECK(second.size() == 2);
    CHECK_THROWS_AS(evaluate(second, Subgraph({ a }), {}), std::invalid_argument);
    CHECK_THROWS_AS(derivative(second, b, wrt(b)), std::invalid_argument);
    CHECK_THROWS_AS(ancestors(second, b), std::invalid_argument);

    CHECK_NOTHROW(first.at(b));
}

TEST_CASE("testing foreign handles sharing a position are rejected", "[graph][checks]")
{
    Graph<double> first;
    Graph<double> second;
    auto fx = first.variable();
    auto sx = second.variable();
    auto sc = second.sum({ sx, sx });

    // fx and sx compare equal by position but belong to different graphs
    REQUIRE(fx == sx);
    CHECK_THROWS_AS(evaluate(second, { { fx, 2.0 } }), std::invalid_argument);
    CHECK_THROWS_AS(evaluate(second, second.full_subgraph(), { { fx, 2.0 } }), std::invalid_argument);
    CHECK_THROWS_AS(derivative(second, sc, wrt(fx)), std::invalid_argument);
    CHECK_THROWS_AS(partial_derivatives(second, sc, { fx }), std::invalid_argument);
    CHECK(second.size() == 2);

    CHECK(evaluate(second, { { sx, 2.0 } }).at(sc) == approx(4.0));
}
#endif
