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
#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <utility>
#include <vector>

// compgraph includes
#include <compgraph/graph/common.hpp>

namespace compgraph {

/**
 * @brief Ordered set of handles scoping an evaluation or a derivative pass
 *
 * A Subgraph holds no duplicates and keeps its handles ascending. Since every
 * child precedes its parents in a graph, ascending order is a topological
 * order, so a Subgraph can be walked front to back.
 */
class Subgraph
{
  public:
    using const_iterator = std::vector<NodeHandle>::const_iterator;

    Subgraph() = default;

    // Sorts and removes duplicates
    explicit Subgraph(std::vector<NodeHandle> handles)
        : handles_(std::move(handles))
    {
        std::sort(handles_.begin(), handles_.end());
        handles_.erase(std::unique(handles_.begin(), handles_.end()), handles_.end());
    }

    Subgraph(std::initializer_list<NodeHandle> handles)
        : Subgraph(std::vector<NodeHandle>(handles))
    {}

    size_t size() const { return handles_.size(); }

    bool empty() const { return handles_.empty(); }

    NodeHandle operator[](size_t i) const { return handles_[i]; }

    NodeHandle front() const { return handles_.front(); }

    NodeHandle back() const { return handles_.back(); }

    const_iterator begin() const { return handles_.begin(); }

    const_iterator end() const { return handles_.end(); }

    bool contains(NodeHandle handle) const
    {
        return std::binary_search(handles_.begin(), handles_.end(), handle);
    }

    const std::vector<NodeHandle>& handles() const { return handles_; }

  private:
    std::vector<NodeHandle> handles_;
};

inline std::ostream& operator<<(std::ostream& out, const Subgraph& subgraph)
{
    out << '{';
    for(size_t i = 0; i < subgraph.size(); ++i) {
        if(i > 0) out << ", ";
        out << subgraph[i];
    }
    return out << '}';
}

} // namespace compgraph
