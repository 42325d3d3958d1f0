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
#include <memory>
#include <utility>
#include <vector>

// compgraph includes
#include <compgraph/graph/common.hpp>
#include <compgraph/graph/node.hpp>
#include <compgraph/graph/nodes/product.hpp>


///////////////////////////
// syntax assistants
///////////////////////////


namespace compgraph {

/**
 * @brief Children of a Sum under construction
 *
 * Produced by adding handles together and converted to a fresh Sum node when
 * handed to Graph::append():
 *
 *   auto c = graph.append(a + b);      // Sum(a, b)
 *   auto d = graph.append(a + b + c);  // Sum(a, b, c), a single node
 */
struct Terms
{
    std::vector<NodeHandle> handles;

    template<typename T>
    operator std::unique_ptr<Node<T>>() const
    {
        return std::make_unique<Sum<T>>(handles);
    }
};

// Factors of a Product under construction, e.g. graph.append(a * b * c)
struct Factors
{
    std::vector<NodeHandle> handles;

    template<typename T>
    operator std::unique_ptr<Node<T>>() const
    {
        return std::make_unique<Product<T>>(handles);
    }
};

inline Terms operator+(NodeHandle lhs, NodeHandle rhs)
{
    return Terms{ { lhs, rhs } };
}

inline Terms operator+(Terms lhs, NodeHandle rhs)
{
    lhs.handles.push_back(rhs);
    return lhs;
}

inline Factors operator*(NodeHandle lhs, NodeHandle rhs)
{
    return Factors{ { lhs, rhs } };
}

inline Factors operator*(Factors lhs, NodeHandle rhs)
{
    lhs.handles.push_back(rhs);
    return lhs;
}

/**
 * @brief Create the set of variables a derivative is taken with respect to
 *
 * Usage: derivative(graph, f, wrt(x, y))
 */
template<typename... Handles>
HandleSet wrt(Handles... handles)
{
    return HandleSet{ handles... };
}

} // namespace compgraph
