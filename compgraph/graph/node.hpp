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


/**
 * @file node.hpp
 * @brief Node-kind contract and the built-in kinds Constant, Variable and Sum
 *
 * Every node kind implements the same two pure operations:
 *
 *   value(self, values)                    -> T
 *   derivative(self, wrt, derivatives)     -> new, unattached node
 *
 * value() may read only the node's own data and the entries of `values` for
 * its children (a Variable reads the entry of its own handle, since it is an
 * input). derivative() may reference only handles found in `derivatives`,
 * i.e. the derivative nodes of its children. Both rely on the graph walking
 * handles in ascending order, so children are always processed first.
 *
 * The kind set is open. A new kind derives from Node<T> and is appended with
 * Graph<T>::push(); Graph, evaluate() and derivative() never need to change.
 */

#pragma once

// C++ includes
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// compgraph includes
#include <compgraph/graph/common.hpp>

namespace compgraph {

template<typename T>
class Node
{
  public:
    virtual ~Node() = default;

    // The input must hold values for all children of this node, and for the
    // node itself when it is a Variable.
    virtual T value(NodeHandle self, const ValueMap<T>& values) const = 0;

    // The input must hold the derivative handle of every child of this node.
    virtual std::unique_ptr<Node<T>> derivative(NodeHandle self, const HandleSet& wrt, const DerivativeMap& derivatives) const = 0;

    virtual const char* kind() const = 0;

    virtual std::vector<NodeHandle> children() const { return {}; }

    virtual void write(std::ostream& out) const { out << kind(); }
};

template<typename T>
using NodePtr = std::unique_ptr<Node<T>>;

using Node_d = Node<double>;

namespace detail {

template<typename T>
const T& lookup_value(const ValueMap<T>& values, NodeHandle handle)
{
    auto it = values.find(handle);
    if(it == values.end()) {
        throw std::out_of_range("No value for node #" + std::to_string(handle.index()));
    }
    return it->second;
}

inline NodeHandle lookup_derivative(const DerivativeMap& derivatives, NodeHandle handle)
{
    auto it = derivatives.find(handle);
    if(it == derivatives.end()) {
        throw std::out_of_range("No derivative for node #" + std::to_string(handle.index()));
    }
    return it->second;
}

inline void write_handles(std::ostream& out, const std::vector<NodeHandle>& handles)
{
    for(size_t i = 0; i < handles.size(); ++i) {
        if(i > 0) out << ", ";
        out << handles[i];
    }
}

} // namespace detail

template<typename T>
class Constant : public Node<T>
{
  public:
    explicit Constant(const T& value)
        : value_(value)
    {}

    const T& constant() const { return value_; }

    T value(NodeHandle /*self*/, const ValueMap<T>& /*values*/) const override
    {
        return value_;
    }

    std::unique_ptr<Node<T>> derivative(NodeHandle /*self*/, const HandleSet& /*wrt*/, const DerivativeMap& /*derivatives*/) const override
    {
        return std::make_unique<Constant<T>>(T{0});
    }

    const char* kind() const override { return "Constant"; }

    void write(std::ostream& out) const override
    {
        out << kind() << '(' << value_ << ')';
    }

  private:
    T value_;
};

// An input of the graph. Its value is supplied by the caller's bindings.
template<typename T>
class Variable : public Node<T>
{
  public:
    T value(NodeHandle self, const ValueMap<T>& values) const override
    {
        auto it = values.find(self);
        if(it == values.end()) {
            throw std::out_of_range("Variable #" + std::to_string(self.index()) + " has no bound value");
        }
        return it->second;
    }

    std::unique_ptr<Node<T>> derivative(NodeHandle self, const HandleSet& wrt, const DerivativeMap& /*derivatives*/) const override
    {
        return std::make_unique<Constant<T>>(wrt.count(self) ? T{1} : T{0});
    }

    const char* kind() const override { return "Variable"; }
};

template<typename T>
class Sum : public Node<T>
{
  public:
    explicit Sum(std::vector<NodeHandle> children)
        : children_(std::move(children))
    {}

    T value(NodeHandle /*self*/, const ValueMap<T>& values) const override
    {
        T result{0};
        for(NodeHandle child : children_)
            result += detail::lookup_value(values, child);
        return result;
    }

    // d(a + b + ...) = da + db + ...
    std::unique_ptr<Node<T>> derivative(NodeHandle /*self*/, const HandleSet& /*wrt*/, const DerivativeMap& derivatives) const override
    {
        std::vector<NodeHandle> dchildren;
        dchildren.reserve(children_.size());
        for(NodeHandle child : children_)
            dchildren.push_back(detail::lookup_derivative(derivatives, child));
        return std::make_unique<Sum<T>>(std::move(dchildren));
    }

    const char* kind() const override { return "Sum"; }

    std::vector<NodeHandle> children() const override { return children_; }

    void write(std::ostream& out) const override
    {
        out << kind() << '(';
        detail::write_handles(out, children_);
        out << ')';
    }

  private:
    std::vector<NodeHandle> children_;
};

template<typename T>
std::ostream& operator<<(std::ostream& out, const Node<T>& node)
{
    node.write(out);
    return out;
}

} // namespace compgraph
