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
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <unordered_map>
#include <unordered_set>

// Handle checks record the owning graph inside every handle and verify it on
// checked access. All translation units of a program must agree on this value.
#ifndef COMPGRAPH_HANDLE_CHECKS
#ifdef NDEBUG
#define COMPGRAPH_HANDLE_CHECKS 0
#else
#define COMPGRAPH_HANDLE_CHECKS 1
#endif
#endif

namespace compgraph {

// Forward declarations
template<typename T>
class Node;
template<typename T>
class Graph;
class Subgraph;

// Use a 32-bit index type for node positions. This keeps handles at 4 bytes
// in release builds, which matters for the hash maps built on every pass.
using NodeIndex_t = uint32_t;

static_assert(sizeof(NodeIndex_t) == 4, "NodeIndex_t must be 32-bit");

// Largest number of nodes a single graph can hold
constexpr size_t MAX_GRAPH_SIZE = static_cast<size_t>(std::numeric_limits<NodeIndex_t>::max());

namespace detail {

// Serial numbers identify graphs for handle checks. Zero is never issued.
inline uint32_t next_graph_serial()
{
    static std::atomic<uint32_t> counter{0};
    uint32_t serial = ++counter;
    if(serial == 0) serial = ++counter;
    return serial;
}

} // namespace detail

/**
 * @brief Opaque reference to a node's position inside one Graph
 *
 * Handles are copyable, totally ordered and hashable by position. Only a Graph
 * can create them, so every handle refers to a node that exists (or existed)
 * in the graph that produced it.
 *
 * Using a handle against a different graph is a caller error. When
 * COMPGRAPH_HANDLE_CHECKS is enabled the owning graph is recorded and checked
 * accessors reject foreign handles; otherwise no cross-graph check exists.
 */
class NodeHandle
{
  public:
    NodeIndex_t index() const { return index_; }

#if COMPGRAPH_HANDLE_CHECKS
    uint32_t owner() const { return owner_; }
#endif

    friend bool operator==(NodeHandle a, NodeHandle b) { return a.index_ == b.index_; }
    friend bool operator!=(NodeHandle a, NodeHandle b) { return a.index_ != b.index_; }
    friend bool operator<(NodeHandle a, NodeHandle b) { return a.index_ < b.index_; }
    friend bool operator<=(NodeHandle a, NodeHandle b) { return a.index_ <= b.index_; }
    friend bool operator>(NodeHandle a, NodeHandle b) { return a.index_ > b.index_; }
    friend bool operator>=(NodeHandle a, NodeHandle b) { return a.index_ >= b.index_; }

  private:
    template<typename T>
    friend class Graph;

    NodeHandle(NodeIndex_t index, uint32_t owner)
        : index_(index)
#if COMPGRAPH_HANDLE_CHECKS
        , owner_(owner)
#endif
    {
        (void)owner;
    }

    NodeIndex_t index_;
#if COMPGRAPH_HANDLE_CHECKS
    uint32_t owner_;
#endif
};

} // namespace compgraph

namespace std {

template<>
struct hash<compgraph::NodeHandle>
{
    size_t operator()(compgraph::NodeHandle handle) const noexcept
    {
        return std::hash<compgraph::NodeIndex_t>()(handle.index());
    }
};

} // namespace std

namespace compgraph {

// Value of each node, keyed by handle. Used both for variable bindings and for
// the values an evaluation pass computes.
template<typename T>
using ValueMap = std::unordered_map<NodeHandle, T>;

// Variables a derivative is taken with respect to
using HandleSet = std::unordered_set<NodeHandle>;

// Original handle -> handle of its derivative node
using DerivativeMap = std::unordered_map<NodeHandle, NodeHandle>;

using ValueMap_d = ValueMap<double>;

inline std::ostream& operator<<(std::ostream& out, NodeHandle handle)
{
    return out << '#' << handle.index();
}

} // namespace compgraph
