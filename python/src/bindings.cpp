#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include "py_value.hpp"
#include <variant>
#include <vector>

namespace py = pybind11;
using namespace attridx;

namespace {

template<typename Id>
py::array to_array(const std::vector<Id>& ids) {
    return py::array_t<Id>(static_cast<py::ssize_t>(ids.size()), ids.data());
}

/**
 * Index over arbitrary Python values with the narrowest id width that
 * fits the object count
 */
class PyAttributeIndex {
    using variant_type = std::variant<py_index<uint8_t>, py_index<uint16_t>,
                                      py_index<uint32_t>, py_index<uint64_t>>;
    variant_type index_;

    static variant_type build(const std::vector<py::object>& objects,
                              const py_extractor& extract, size_t threshold) {
        const index_config config{.cardinality_threshold = threshold};
        return dispatch_id_width(smallest_id_width(objects.size()), [&](auto tag) -> variant_type {
            using Id = typename decltype(tag)::type;
            auto index = py_index<Id>::build(objects, extract, config);
            if (!index) {
                throw std::overflow_error(std::string(error_message(index.error())));
            }
            return std::move(*index);
        });
    }

public:
    PyAttributeIndex(const std::vector<py::object>& objects, py::object attr, size_t threshold)
        : index_(build(objects, py_extractor(std::move(attr)), threshold)) {}

    template<typename F>
    decltype(auto) visit(F&& f) const {
        return std::visit(std::forward<F>(f), index_);
    }
};

} // namespace

PYBIND11_MODULE(attridx, m) {
    m.doc() = R"pbdoc(
        attridx - immutable attribute indexes
        =====================================

        Finds which objects in a fixed sequence have a given attribute
        value. Values only need to be hashable and comparable with ==,
        never sortable.
    )pbdoc";

    py::register_exception<unhashable_value_error>(m, "UnhashableValueError", PyExc_TypeError);

    m.attr("DEFAULT_THRESHOLD") = default_cardinality_threshold;

    py::class_<PyAttributeIndex>(m, "AttributeIndex")
        .def(py::init<const std::vector<py::object>&, py::object, size_t>(),
             py::arg("objects"), py::arg("attr"),
             py::arg("threshold") = default_cardinality_threshold,
             R"pbdoc(
             Index objects by one attribute.

             Parameters
             ----------
             objects : sequence
                 The objects; an object's id is its position.
             attr : str or callable
                 Attribute name (key for mappings, getattr otherwise) or a function
                 of the object. Objects lacking the attribute are skipped.
             threshold : int
                 Values held by more objects than this get a dedicated
                 sorted id array.

             Raises
             ------
             UnhashableValueError
                 An attribute value cannot be hashed.
             )pbdoc")

        .def("get", [](const PyAttributeIndex& self, py::object value) {
            return self.visit([&](const auto& index) { return to_array(index.get(value)); });
        }, py::arg("value"), "Sorted ids of objects whose attribute equals value")

        .def("get_all", [](const PyAttributeIndex& self) {
            return self.visit([](const auto& index) { return to_array(index.get_all()); });
        }, "Sorted ids of every object that has the attribute")

        .def("count", [](const PyAttributeIndex& self, py::object value) {
            return self.visit([&](const auto& index) { return index.count(value); });
        }, py::arg("value"), "Number of objects whose attribute equals value")

        .def("__contains__", [](const PyAttributeIndex& self, py::object value) {
            return self.visit([&](const auto& index) { return index.contains(value); });
        })

        .def("__len__", [](const PyAttributeIndex& self) {
            return self.visit([](const auto& index) { return index.size(); });
        })

        .def("stats", [](const PyAttributeIndex& self) {
            return self.visit([](const auto& index) {
                const auto& s = index.statistics();
                py::dict d;
                d["object_count"] = s.object_count;
                d["indexed_count"] = s.indexed_count;
                d["distinct_values"] = s.distinct_values;
                d["high_cardinality_values"] = s.high_cardinality_values;
                d["direct_entries"] = s.direct_entries;
                d["bucketed_entries"] = s.bucketed_entries;
                d["unique_hashes"] = s.unique_hashes;
                d["hash_collisions"] = s.hash_collisions;
                d["largest_bucket"] = s.largest_bucket;
                d["threshold"] = index.threshold();
                d["id_bits"] = sizeof(typename std::decay_t<decltype(index)>::id_type) * 8;
                return d;
            });
        }, "Build statistics")

        .def("__repr__", [](const PyAttributeIndex& self) {
            return self.visit([](const auto& index) {
                return "<AttributeIndex size=" + std::to_string(index.size()) +
                       " threshold=" + std::to_string(index.threshold()) + ">";
            });
        });
}
