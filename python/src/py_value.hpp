#pragma once

#include <attridx/attridx.hpp>
#include <pybind11/pybind11.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace py = pybind11;

/**
 * Raised when an attribute value has no usable __hash__
 */
struct unhashable_value_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/**
 * Python's own hash, so values equal under == hash equal
 */
struct py_hash {
    uint64_t operator()(const py::object& x) const {
        Py_hash_t h = PyObject_Hash(x.ptr());
        if (h == -1 && PyErr_Occurred()) {
            // Only a missing __hash__ means unhashable; other errors pass through
            if (!PyErr_ExceptionMatches(PyExc_TypeError)) {
                throw py::error_already_set();
            }
            py::error_already_set cause;
            throw unhashable_value_error(
                std::string(attridx::error_message(attridx::error::unhashable_value)) +
                ": " + cause.what());
        }
        return static_cast<uint64_t>(h);
    }
};

struct py_equal {
    bool operator()(const py::object& a, const py::object& b) const {
        return a.equal(b);
    }
};

template<typename Id>
using py_index = attridx::attribute_index<py::object, Id, py_hash, py_equal>;

/**
 * Attribute extractor: a name (key lookup on collections.abc.Mapping
 * objects, getattr otherwise) or a callable
 */
class py_extractor {
    py::object attr_;
    std::optional<std::string> name_;
    py::object mapping_type_;

public:
    explicit py_extractor(py::object attr) : attr_(std::move(attr)) {
        if (py::isinstance<py::str>(attr_)) {
            name_ = attr_.cast<std::string>();
            mapping_type_ = py::module_::import("collections.abc").attr("Mapping");
        } else if (!PyCallable_Check(attr_.ptr())) {
            throw py::type_error("attr must be an attribute name or a callable");
        }
    }

    std::optional<py::object> operator()(const py::object& obj) const {
        if (!name_) {
            return attr_(obj);
        }
        if (py::isinstance(obj, mapping_type_)) {
            if (!obj.contains(attr_)) {
                return std::nullopt;
            }
            py::object value = obj[attr_];
            return value;
        }
        if (!py::hasattr(obj, name_->c_str())) {
            return std::nullopt;
        }
        return obj.attr(name_->c_str());
    }
};
