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


// pybind11 includes
#include "pybind11.hxx"

// C++ includes
#include <functional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// compgraph includes
#include <compgraph/graph.hpp>
using namespace compgraph;

namespace {

template<typename T>
std::string str(const T& value)
{
    std::ostringstream out;
    out << value;
    return out.str();
}

} // namespace

void exportNodeHandle(py::module& m)
{
    py::class_<NodeHandle>(m, "NodeHandle")
        .def_property_readonly("index", &NodeHandle::index)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def(py::self < py::self)
        .def(py::self <= py::self)
        .def(py::self > py::self)
        .def(py::self >= py::self)
        .def("__hash__", [](NodeHandle self) { return std::hash<NodeHandle>()(self); })
        .def("__repr__", [](NodeHandle self) { return str(self); })
        ;
}

void exportSubgraph(py::module& m)
{
    py::class_<Subgraph>(m, "Subgraph")
        .def(py::init<>())
        .def(py::init<std::vector<NodeHandle>>())
        .def("__len__", &Subgraph::size)
        .def("__contains__", &Subgraph::contains)
        .def("__getitem__", [](const Subgraph& self, size_t i) {
            if(i >= self.size()) throw py::index_error("Subgraph index out of range");
            return self[i];
        })
        .def("__iter__", [](const Subgraph& self) { return py::make_iterator(self.begin(), self.end()); }, py::keep_alive<0, 1>())
        .def("__repr__", [](const Subgraph& self) { return str(self); })
        ;

    py::class_<Derivative>(m, "Derivative")
        .def_readonly("handle", &Derivative::handle)
        .def_readonly("subgraph", &Derivative::subgraph)
        ;
}

void exportGraph(py::module& m)
{
    py::class_<Graph_d>(m, "Graph")
        .def(py::init<size_t>(), py::arg("initial_capacity") = 0)
        .def("constant", &Graph_d::constant)
        .def("variable", &Graph_d::variable)
        .def("sum", &Graph_d::sum)
        .def("product", [](Graph_d& self, std::vector<NodeHandle> children) { return self.push(Product<double>(std::move(children))); })
        .def("handle", &Graph_d::handle)
        .def("kind", [](const Graph_d& self, NodeHandle handle) { return std::string(self.at(handle).kind()); })
        .def("children", [](const Graph_d& self, NodeHandle handle) { return self.at(handle).children(); })
        .def("node_repr", [](const Graph_d& self, NodeHandle handle) { return str(self.at(handle)); })
        .def("full_subgraph", &Graph_d::full_subgraph)
        .def("__len__", &Graph_d::size)
        .def("__str__", [](const Graph_d& self) { return str(self); })
        ;
}

void exportAlgorithms(py::module& m)
{
    m.def("evaluate", [](const Graph_d& graph, const Subgraph& subgraph, ValueMap_d bindings) {
        return evaluate(graph, subgraph, std::move(bindings));
    }, py::arg("graph"), py::arg("subgraph"), py::arg("bindings") = ValueMap_d{});

    m.def("evaluate", [](const Graph_d& graph, ValueMap_d bindings) {
        return evaluate(graph, std::move(bindings));
    }, py::arg("graph"), py::arg("bindings") = ValueMap_d{});

    m.def("derivative", [](Graph_d& graph, NodeHandle of, const HandleSet& wrt) {
        return derivative(graph, of, wrt);
    }, py::arg("graph"), py::arg("of"), py::arg("wrt"));

    m.def("partial_derivatives", [](Graph_d& graph, NodeHandle of, const std::vector<NodeHandle>& variables) {
        return partial_derivatives(graph, of, variables);
    }, py::arg("graph"), py::arg("of"), py::arg("variables"));

    m.def("ancestors", [](const Graph_d& graph, NodeHandle root) {
        return ancestors(graph, root);
    }, py::arg("graph"), py::arg("root"));
}
