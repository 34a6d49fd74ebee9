#include "common/python.hpp"
#include <boost/python.hpp>

namespace bp = boost::python;

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

void python_initialize(const char *program_name) {
    if (Py_IsInitialized()) return;
    wchar_t *progname = Py_DecodeLocale(program_name, NULL);
    Py_SetProgramName(progname);
    Py_InitializeEx(0);
}

std::string fetch_python_error() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) return "";
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> htype(type), hvalue(bp::allow_null(value)), htraceback(bp::allow_null(traceback));
    std::string name = ((PyTypeObject *)type)->tp_name;
    if (!value) return name;
    PyObject *str = PyObject_Str(value);
    if (!str) {
        PyErr_Clear();
        return name;
    }
    bp::handle<> hstr(str);
    const char *text = PyUnicode_AsUTF8(str);
    if (!text) {
        PyErr_Clear();
        return name;
    }
    return name + ": " + text;
}
