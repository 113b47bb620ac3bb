#include "common/python.hpp"
#include <cstring>
#include <glog/logging.h>
#include <utility>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

PyThread_guard::PyThread_guard() {
    state = PyEval_SaveThread();
}

PyThread_guard::~PyThread_guard() {
    PyEval_RestoreThread(state);
}

py_ref::py_ref(PyObject *obj) : obj(obj) {}

py_ref::py_ref(const py_ref &other) : obj(other.obj) {
    Py_XINCREF(obj);
}

py_ref::py_ref(py_ref &&other) noexcept : obj(other.obj) {
    other.obj = nullptr;
}

py_ref::~py_ref() {
    Py_XDECREF(obj);
}

py_ref &py_ref::operator=(py_ref other) noexcept {
    swap(obj, other.obj);
    return *this;
}

py_ref py_ref::borrow(PyObject *obj) {
    Py_XINCREF(obj);
    return py_ref(obj);
}

PyObject *py_ref::get() const {
    return obj;
}

py_ref::operator bool() const {
    return obj != nullptr;
}

string to_utf8(PyObject *unicode) {
    if (!unicode) return "";
    Py_ssize_t size;
    const char *data = PyUnicode_AsUTF8AndSize(unicode, &size);
    if (!data) {
        PyErr_Clear();
        return "";
    }
    return string(data, size);
}

python_error fetch_python_error() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    py_ref t(type), v(value), tb(traceback);

    python_error error;
    if (!t) return error;

    // 扩展模块中的异常类名带有模块前缀，与 type(e).__name__ 保持一致
    const char *name = PyExceptionClass_Name(t.get());
    const char *dot = strrchr(name, '.');
    error.type = dot ? dot + 1 : name;
    if (v) {
        py_ref message(PyObject_Str(v.get()));
        if (message)
            error.message = to_utf8(message.get());
        else
            PyErr_Clear();
    }

    py_ref module(PyImport_ImportModule("traceback"));
    if (module) {
        py_ref lines(PyObject_CallMethod(module.get(), "format_exception", "OOO",
                                         t.get(), v ? v.get() : Py_None, tb ? tb.get() : Py_None));
        py_ref empty(PyUnicode_FromString(""));
        if (lines && empty) {
            py_ref joined(PyUnicode_Join(empty.get(), lines.get()));
            if (joined) error.traceback = to_utf8(joined.get());
        }
    }
    PyErr_Clear();
    return error;
}

python_interpreter::python_interpreter() {
    if (Py_IsInitialized())
        throw internal_error("Python interpreter has already been initialized");

    Py_InitializeEx(0);
    if (PyRun_SimpleString("import sys\nsys.stdout = sys.stderr\n") != 0)
        LOG(WARNING) << "Unable to redirect sys.stdout of the embedded interpreter";

    LOG(INFO) << "Embedded Python " << Py_GetVersion() << " initialized";
    state = PyEval_SaveThread();
}

python_interpreter::~python_interpreter() {
    PyEval_RestoreThread(state);
    if (Py_FinalizeEx() != 0)
        LOG(WARNING) << "Embedded Python interpreter was not finalized cleanly";
}

}  // namespace grader
