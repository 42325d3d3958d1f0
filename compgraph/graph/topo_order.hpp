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
#include <cstdint>
#include <utility>
#include <vector>

// compgraph includes
#include <compgraph/graph/common.hpp>
#include <compgraph/graph/graph.hpp>
#include <compgraph/graph/subgraph.hpp>

namespace compgraph {

/**
 * @brief The root and every node it depends on, as an ascending Subgraph
 *
 * Uses an explicit stack instead of recursion, so deep chains cannot exhaust
 * the call stack, and marks visited nodes so that shared children of a DAG
 * are expanded once. All ancestors have handles not greater than the root,
 * which bounds the visited table.
 *
 * Evaluating the result computes the root without touching unrelated nodes.
 */
template<typename T>
Subgraph ancestors(const Graph<T>& graph, NodeHandle root)
{
    graph.check(root);

    std::vector<uint8_t> visited(static_cast<size_t>(root.index()) + 1, 0u);
    std::vector<NodeHandle> order;
    std::vector<NodeHandle> stack;
    stack.reserve(256);

    visited[root.index()] = 1u;
    stack.push_back(root);

    while(!stack.empty()) {
        NodeHandle handle = stack.back();
        stack.pop_back();
        order.push_back(handle);
        for(NodeHandle child : graph[handle].children()) {
            if(visited[child.index()]) continue;
            visited[child.index()] = 1u;
            stack.push_back(child);
        }
    }

    return Subgraph(std::move(order));
}

/**
 * @brief Check that walking the subgraph front to back is a topological order
 *
 * True when handles are strictly ascending and every child of every node has
 * a smaller handle than the node itself.
 */
template<typename T>
bool is_topological(const Graph<T>& graph, const Subgraph& subgraph)
{
    for(size_t i = 0; i < subgraph.size(); ++i) {
        const NodeHandle handle = subgraph[i];
        if(i > 0 && !(subgraph[i - 1] < handle)) return false;
        for(NodeHandle child : graph.at(handle).children())
            if(!(child < handle)) return false;
    }
    return true;
}

} // namespace compgraph
