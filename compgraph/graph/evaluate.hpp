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

// compgraph includes
#include <compgraph/graph/common.hpp>
#include <compgraph/graph/graph.hpp>
#include <compgraph/graph/subgraph.hpp>

namespace compgraph {

/**
 * @brief Compute the value of every node of a subgraph
 *
 * The result starts as a copy of `bindings` (typically Variable handles mapped
 * to their values). Handles of the subgraph are then visited in ascending
 * order; each node computes its value from the entries gathered so far and
 * the result is stored under its handle, replacing any pre-bound value.
 *
 * Ascending order is required for correctness: a node may only depend on
 * handles smaller than its own. Every handle of the subgraph has an entry in
 * the returned mapping.
 *
 * Throws std::out_of_range when a Variable of the subgraph is unbound or a
 * child value is missing (a child outside both the subgraph and bindings).
 * With handle checks on, a binding or subgraph handle of another graph is
 * rejected with std::invalid_argument.
 */
template<typename T>
ValueMap<T> evaluate(const Graph<T>& graph, const Subgraph& subgraph, ValueMap<T> bindings)
{
#if COMPGRAPH_HANDLE_CHECKS
    for(const auto& binding : bindings)
        graph.check(binding.first);
#endif
    ValueMap<T> values = std::move(bindings);
    values.reserve(values.size() + subgraph.size());

    for(NodeHandle handle : subgraph) {
#if COMPGRAPH_HANDLE_CHECKS
        graph.check(handle);
#endif
        T value = graph[handle].value(handle, values);
        values.insert_or_assign(handle, value);
    }

    return values;
}

// Evaluate every node of the graph
template<typename T>
ValueMap<T> evaluate(const Graph<T>& graph, ValueMap<T> bindings)
{
    return evaluate(graph, graph.full_subgraph(), std::move(bindings));
}

} // namespace compgraph
