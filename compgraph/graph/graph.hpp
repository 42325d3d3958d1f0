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
#include <cassert>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// compgraph includes
#include <compgraph/graph/common.hpp>
#include <compgraph/graph/node.hpp>
#include <compgraph/graph/subgraph.hpp>

namespace compgraph {

/**
 * @brief Append-only node store
 *
 * The graph owns every node exclusively and hands out NodeHandle values as
 * positions into its storage. Nodes are never removed nor mutated once
 * appended, so a handle stays valid for the lifetime of the graph.
 *
 * OPERATIONS:
 * ==========
 * - append()/push(): add a node, return its handle
 * - operator[]: access by handle (debug-checked only)
 * - at(): access by handle, always checked
 * - full_subgraph(): every handle in ascending order
 *
 * A node may only reference handles that already exist when it is appended.
 * Hence children always have smaller handles than their parents, and
 * ascending handle order is a topological order of the whole graph.
 *
 * A graph is not safe for concurrent use while it is being appended to.
 */
template<typename T>
class Graph
{
  private:
    std::vector<NodePtr<T>> nodes_;
    uint32_t serial_;

  public:
    explicit Graph(size_t initial_capacity = 0)
        : serial_(detail::next_graph_serial())
    {
        nodes_.reserve(initial_capacity);
    }

    // Non-copyable, movable
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;
    Graph(Graph&&) = default;
    Graph& operator=(Graph&&) = default;

    void reserve(size_t new_capacity)
    {
        nodes_.reserve(new_capacity);
    }

    // Add node to the graph and return its handle
    NodeHandle append(NodePtr<T> node)
    {
        if(!node) {
            throw std::invalid_argument("Cannot append a null node to a graph");
        }
        // Ensure we won't overflow the 32-bit NodeIndex_t
        if(nodes_.size() >= MAX_GRAPH_SIZE) {
            throw std::runtime_error("Graph exceeded maximum index for NodeHandle");
        }
#if COMPGRAPH_HANDLE_CHECKS
        for(NodeHandle child : node->children())
            check(child);
#endif
        const auto index = static_cast<NodeIndex_t>(nodes_.size());
        nodes_.emplace_back(std::move(node));
        return NodeHandle(index, serial_);
    }

    template<typename N>
    NodeHandle push(N node)
    {
        static_assert(std::is_base_of<Node<T>, N>::value, "Only node kinds deriving from Node<T> can be pushed");
        return append(std::make_unique<N>(std::move(node)));
    }

    NodeHandle constant(const T& value)
    {
        return append(std::make_unique<Constant<T>>(value));
    }

    NodeHandle variable()
    {
        return append(std::make_unique<Variable<T>>());
    }

    NodeHandle sum(std::vector<NodeHandle> children)
    {
        return append(std::make_unique<Sum<T>>(std::move(children)));
    }

    // Access node by handle
    const Node<T>& operator[](NodeHandle handle) const
    {
        assert(handle.index() < nodes_.size());
#if COMPGRAPH_HANDLE_CHECKS
        assert(handle.owner() == serial_);
#endif
        return *nodes_[handle.index()];
    }

    const Node<T>& at(NodeHandle handle) const
    {
        check(handle);
        return *nodes_[handle.index()];
    }

    // Handle of the node at an existing position
    NodeHandle handle(size_t position) const
    {
        if(position >= nodes_.size()) {
            throw std::out_of_range("Graph has no node at position " + std::to_string(position));
        }
        return NodeHandle(static_cast<NodeIndex_t>(position), serial_);
    }

    // Throws if the handle does not refer to a node of this graph
    void check(NodeHandle handle) const
    {
#if COMPGRAPH_HANDLE_CHECKS
        if(handle.owner() != serial_) {
            throw std::invalid_argument("Node #" + std::to_string(handle.index()) + " belongs to a different graph");
        }
#endif
        if(handle.index() >= nodes_.size()) {
            throw std::out_of_range("Graph has no node #" + std::to_string(handle.index()));
        }
    }

    size_t size() const
    {
        return nodes_.size();
    }

    bool empty() const
    {
        return nodes_.empty();
    }

    // All current handles in ascending order
    Subgraph full_subgraph() const
    {
        std::vector<NodeHandle> handles;
        handles.reserve(nodes_.size());
        for(size_t i = 0; i < nodes_.size(); ++i)
            handles.push_back(NodeHandle(static_cast<NodeIndex_t>(i), serial_));
        return Subgraph(std::move(handles));
    }
};

using Graph_d = Graph<double>;

template<typename T>
std::ostream& operator<<(std::ostream& out, const Graph<T>& graph)
{
    for(NodeHandle handle : graph.full_subgraph())
        out << handle << " = " << graph[handle] << '\n';
    return out;
}

} // namespace compgraph
