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
#include <memory>
#include <ostream>
#include <utility>
#include <vector>

// compgraph includes
#include <compgraph/graph/node.hpp>

namespace compgraph {

/**
 * @brief Sum of products of node values
 *
 * Holds a list of terms, each a list of factor handles:
 *
 *   value = sum_i prod_j values[terms[i][j]]
 *
 * The kind is closed under differentiation. Replacing one factor of one term
 * by its derivative, for every factor of every term, gives the derivative as
 * another SumOfProducts. This is what the product rule of Product produces,
 * and it keeps higher-order derivatives at one node per original handle.
 */
template<typename T>
class SumOfProducts : public Node<T>
{
  public:
    using Term = std::vector<NodeHandle>;

    explicit SumOfProducts(std::vector<Term> terms)
        : terms_(std::move(terms))
    {}

    const std::vector<Term>& terms() const { return terms_; }

    T value(NodeHandle /*self*/, const ValueMap<T>& values) const override
    {
        T result{0};
        for(const Term& term : terms_) {
            T product{1};
            for(NodeHandle factor : term)
                product *= detail::lookup_value(values, factor);
            result += product;
        }
        return result;
    }

    std::unique_ptr<Node<T>> derivative(NodeHandle /*self*/, const HandleSet& /*wrt*/, const DerivativeMap& derivatives) const override
    {
        std::vector<Term> dterms;
        for(const Term& term : terms_) {
            for(size_t k = 0; k < term.size(); ++k) {
                Term dterm = term;
                dterm[k] = detail::lookup_derivative(derivatives, term[k]);
                dterms.push_back(std::move(dterm));
            }
        }
        return std::make_unique<SumOfProducts<T>>(std::move(dterms));
    }

    const char* kind() const override { return "SumOfProducts"; }

    // Every distinct factor, in first-appearance order
    std::vector<NodeHandle> children() const override
    {
        std::vector<NodeHandle> result;
        for(const Term& term : terms_)
            for(NodeHandle factor : term)
                if(std::find(result.begin(), result.end(), factor) == result.end())
                    result.push_back(factor);
        return result;
    }

    void write(std::ostream& out) const override
    {
        out << kind() << '(';
        for(size_t i = 0; i < terms_.size(); ++i) {
            if(i > 0) out << " + ";
            out << '[';
            for(size_t j = 0; j < terms_[i].size(); ++j) {
                if(j > 0) out << " * ";
                out << terms_[i][j];
            }
            out << ']';
        }
        out << ')';
    }

  private:
    std::vector<Term> terms_;
};

template<typename T>
class Product : public Node<T>
{
  public:
    explicit Product(std::vector<NodeHandle> children)
        : children_(std::move(children))
    {}

    T value(NodeHandle /*self*/, const ValueMap<T>& values) const override
    {
        T result{1};
        for(NodeHandle child : children_)
            result *= detail::lookup_value(values, child);
        return result;
    }

    // Product rule: d(a * b * c) = da * b * c + a * db * c + a * b * dc
    std::unique_ptr<Node<T>> derivative(NodeHandle /*self*/, const HandleSet& /*wrt*/, const DerivativeMap& derivatives) const override
    {
        std::vector<typename SumOfProducts<T>::Term> terms;
        terms.reserve(children_.size());
        for(size_t k = 0; k < children_.size(); ++k) {
            auto term = children_;
            term[k] = detail::lookup_derivative(derivatives, children_[k]);
            terms.push_back(std::move(term));
        }
        return std::make_unique<SumOfProducts<T>>(std::move(terms));
    }

    const char* kind() const override { return "Product"; }

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

} // namespace compgraph
