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


#pragma once

// C++ includes
#include <utility>
#include <vector>

// compgraph includes
#include <compgraph/graph/common.hpp>
#include <compgraph/graph/graph.hpp>
#include <compgraph/graph/subgraph.hpp>

namespace compgraph {

// Result of a differentiation pass
struct Derivative
{
    NodeHandle handle;   // derivative of the requested target
    Subgraph subgraph;   // every node appended by the pass
};

namespace detail {

// Differentiates the nodes at positions [0, n) and appends one node for each
template<typename T>
Derivative differentiate_prefix(Graph<T>& graph, size_t n, NodeHandle of, const HandleSet& wrt)
{
    DerivativeMap derivatives;
    derivatives.reserve(n);
    std::vector<NodeHandle> appended;
    appended.reserve(n);

    for(size_t i = 0; i < n; ++i) {
        const NodeHandle old_handle = graph.handle(i);
        NodePtr<T> dnode = graph[old_handle].derivative(old_handle, wrt, derivatives);
        const NodeHandle new_handle = graph.append(std::move(dnode));
        derivatives.emplace(old_handle, new_handle);
        appended.push_back(new_handle);
    }

    return { derivatives.at(of), Subgraph(std::move(appended)) };
}

template<typename T>
void check_all(const Graph<T>& graph, const HandleSet& handles)
{
#if COMPGRAPH_HANDLE_CHECKS
    for(NodeHandle handle : handles)
        graph.check(handle);
#else
    (void)graph;
    (void)handles;
#endif
}

} // namespace detail

/**
 * @brief Append the derivative of every node and return the one of `of`
 *
 * Walks all handles existing at call time in ascending order. Each node
 * builds its derivative node from the derivative handles of its children,
 * which are already recorded since children precede parents. The new node is
 * appended and recorded as the derivative of the original handle.
 *
 * Each original handle maps to exactly one derivative node. A child shared
 * by several parents is differentiated once and referenced by all of them,
 * so the work is linear in the node count even when the number of paths
 * through the graph is exponential.
 *
 * Every node is differentiated, not only the ancestors of `of`. Nodes that do
 * not feed into `of` produce derivative nodes nobody uses.
 *
 * The returned subgraph holds one handle per node that existed at call time.
 * When the graph holds only Constant, Variable and Sum nodes, evaluating it
 * with no bindings yields the derivative values, since derivative nodes of
 * Variables are Constants. Kinds like Product refer back to original nodes in
 * their derivatives; evaluate the whole graph, or bind those values, then.
 *
 * Throws std::out_of_range when `of` is not a node of the graph, and
 * std::invalid_argument for handles of another graph when handle checks are on.
 */
template<typename T>
Derivative derivative(Graph<T>& graph, NodeHandle of, const HandleSet& wrt)
{
    graph.check(of);
    detail::check_all(graph, wrt);
    return detail::differentiate_prefix(graph, graph.size(), of, wrt);
}

/**
 * @brief Partial derivatives of `of` with respect to each of `variables`
 *
 * Runs one differentiation pass per variable with a single-element wrt set.
 * Every pass differentiates only the nodes that existed before the first one,
 * so each appends the same number of nodes and the graph grows linearly in
 * the number of variables.
 */
template<typename T>
std::vector<Derivative> partial_derivatives(Graph<T>& graph, NodeHandle of, const std::vector<NodeHandle>& variables)
{
    graph.check(of);
    for(NodeHandle variable : variables)
        graph.check(variable);

    const size_t n = graph.size();
    std::vector<Derivative> result;
    result.reserve(variables.size());
    for(NodeHandle variable : variables)
        result.push_back(detail::differentiate_prefix(graph, n, of, HandleSet{ variable }));
    return result;
}

} // namespace compgraph
