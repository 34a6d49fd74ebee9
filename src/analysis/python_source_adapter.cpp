#include <boost/algorithm/string.hpp>
#include <boost/python.hpp>
#include <regex>
#include "analysis/source_analysis.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"

namespace vibe {
using namespace std;
namespace bp = boost::python;

static bool is_instance(const bp::object &obj, const bp::object &type) {
    if (type.is_none()) return false;
    int result = PyObject_IsInstance(obj.ptr(), type.ptr());
    if (result < 0) bp::throw_error_already_set();
    return result == 1;
}

static bool truthy(const bp::object &obj) {
    int result = PyObject_IsTrue(obj.ptr());
    if (result < 0) bp::throw_error_already_set();
    return result == 1;
}

static string to_string(const bp::object &obj) {
    return bp::extract<string>(bp::str(obj));
}

static string top_level_module(const string &name) {
    return name.substr(0, name.find('.'));
}

// 调用者已经确认当前异常是 SyntaxError 或 ValueError
static parse_error fetch_parse_error() {
    PyObject *type, *value, *traceback;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> htype(type), hvalue(bp::allow_null(value)), htraceback(bp::allow_null(traceback));

    parse_error error;
    if (!value) {
        error.message = error.description = ((PyTypeObject *)type)->tp_name;
        return error;
    }

    bp::object exc(hvalue);
    error.description = to_string(exc);
    error.message = error.description;
    if (PyErr_GivenExceptionMatches(type, PyExc_SyntaxError)) {
        bp::object lineno = bp::getattr(exc, "lineno", bp::object());
        if (!lineno.is_none()) error.line = bp::extract<int>(lineno);
        bp::object msg = bp::getattr(exc, "msg", bp::object());
        if (!msg.is_none()) error.message = to_string(msg);
    }
    return error;
}

static void scan_python_lines(const string &source, source_analysis &analysis) {
    static const regex print_call(R"(\bprint\s*\()");
    auto lines = split_lines(source);
    analysis.total_lines = lines.size();
    for (auto &line : lines) {
        if (utf8_length(line) > 120)
            ++analysis.long_lines;
        if (line.find("TODO") != string::npos || line.find("FIXME") != string::npos)
            ++analysis.todo_count;
        if (regex_search(line, print_call) && !boost::algorithm::starts_with(boost::algorithm::trim_left_copy(line), "#"))
            ++analysis.debug_output_count;
    }
}

source_analysis python_source_adapter::analyze(const string &source, const string &filename) const {
    source_analysis analysis;
    scan_python_lines(source, analysis);

    GIL_guard guard;
    try {
        bp::object ast = bp::import("ast");
        bp::object tree;
        try {
            tree = ast.attr("parse")(source, filename);
        } catch (const bp::error_already_set &) {
            // 源代码中的 NUL 字符或非法编码会导致 ValueError，与语法错误同等对待
            if (PyErr_ExceptionMatches(PyExc_SyntaxError) || PyErr_ExceptionMatches(PyExc_ValueError)) {
                analysis.error = fetch_parse_error();
                analysis.issues.push_back({analysis.error->line, "syntax_error", analysis.error->message});
                return analysis;
            }
            throw;
        }

        bp::object get_docstring = ast.attr("get_docstring");
        bp::object Import = ast.attr("Import"), ImportFrom = ast.attr("ImportFrom");
        bp::object FunctionDef = ast.attr("FunctionDef"), AsyncFunctionDef = ast.attr("AsyncFunctionDef");
        bp::object Try = ast.attr("Try"), TryStar = bp::getattr(ast, "TryStar", bp::object());
        bp::object BoolOp = ast.attr("BoolOp");
        vector<bp::object> branches = {
            ast.attr("If"), ast.attr("While"), ast.attr("For"), ast.attr("ExceptHandler"),
            ast.attr("With"), ast.attr("Assert"), ast.attr("comprehension")};

        bp::stl_input_iterator<bp::object> it(ast.attr("walk")(tree)), end;
        for (; it != end; ++it) {
            bp::object node = *it;

            if (is_instance(node, Import)) {
                bp::stl_input_iterator<bp::object> alias(node.attr("names")), alias_end;
                for (; alias != alias_end; ++alias)
                    analysis.imports.insert(top_level_module(to_string((*alias).attr("name"))));
            } else if (is_instance(node, ImportFrom)) {
                // 相对导入 (from . import x, from .a import b) 不计入
                int level = bp::extract<int>(node.attr("level"));
                bp::object module = node.attr("module");
                if (level == 0 && !module.is_none())
                    analysis.imports.insert(top_level_module(to_string(module)));
            } else if (is_instance(node, FunctionDef) || is_instance(node, AsyncFunctionDef)) {
                function_info func;
                func.name = to_string(node.attr("name"));
                func.line = bp::extract<int>(node.attr("lineno"));
                bp::object end_lineno = bp::getattr(node, "end_lineno", bp::object());
                if (end_lineno.is_none()) {
                    func.length = 10;
                } else {
                    int end_line = bp::extract<int>(end_lineno);
                    func.length = end_line - func.line + 1;
                }
                func.has_docstring = truthy(get_docstring(node));
                func.has_type_hints = truthy(node.attr("returns"));
                bp::stl_input_iterator<bp::object> arg(node.attr("args").attr("args")), arg_end;
                for (; arg != arg_end && !func.has_type_hints; ++arg)
                    func.has_type_hints = truthy((*arg).attr("annotation"));
                analysis.functions.push_back(func);
            }

            if (is_instance(node, Try) || is_instance(node, TryStar)) {
                ++analysis.try_count;
                analysis.has_error_handling = true;
            }

            for (auto &branch : branches)
                if (is_instance(node, branch)) {
                    ++analysis.complexity;
                    break;
                }
            if (is_instance(node, BoolOp))
                analysis.complexity += (int)bp::len(node.attr("values")) - 1;
        }
    } catch (const bp::error_already_set &) {
        throw internal_error("unable to analyze " + filename + ": " + fetch_python_error());
    }
    return analysis;
}

}  // namespace vibe
