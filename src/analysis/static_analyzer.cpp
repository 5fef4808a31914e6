#include "analysis/static_analyzer.hpp"
#include <boost/python.hpp>
#include <boost/python/stl_iterator.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"

namespace tutor {
using namespace std;
namespace bp = boost::python;

/**
 * @brief 取出当前的 Python 异常并转换为字符串，同时清除异常状态
 */
static string fetch_python_error() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> htype(bp::allow_null(type)), hvalue(bp::allow_null(value)), htraceback(bp::allow_null(traceback));
    if (!hvalue.get()) return "unknown Python error";

    bp::object error(hvalue);
    string name = bp::extract<string>(error.attr("__class__").attr("__name__"));
    string message = bp::extract<string>(bp::str(error));
    return name + ": " + message;
}

/**
 * @brief 将 SyntaxError 转换为分析结果，调用时 Python 异常必须是 SyntaxError
 */
static structural_facts syntax_error_facts() {
    PyObject *type = nullptr, *value = nullptr, *traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    PyErr_NormalizeException(&type, &value, &traceback);
    bp::handle<> htype(bp::allow_null(type)), hvalue(bp::allow_null(value)), htraceback(bp::allow_null(traceback));

    structural_facts facts;
    facts.is_valid = false;
    facts.complexity_score = 1;

    string message = "invalid syntax";
    if (hvalue.get()) {
        bp::object error(hvalue);
        bp::object lineno = error.attr("lineno");
        if (!lineno.is_none()) facts.syntax_error_line = bp::extract<int>(lineno);
        bp::object msg = error.attr("msg");
        if (!msg.is_none()) message = bp::extract<string>(bp::str(msg));
    }
    facts.syntax_errors.push_back(fmt::format("Syntax error at line {}: {}", facts.syntax_error_line, message));
    return facts;
}

structural_facts analyze_structure(const string &code) {
    GIL_guard guard;

    try {
        bp::object ast = bp::import("ast");
        bp::object tree;
        try {
            tree = ast.attr("parse")(utf8_sanitize(code));
        } catch (bp::error_already_set &) {
            // IndentationError 和 TabError 都是 SyntaxError 的子类
            if (PyErr_ExceptionMatches(PyExc_SyntaxError))
                return syntax_error_facts();
            throw;
        }

        structural_facts facts;
        facts.is_valid = true;
        facts.complexity_score = 1;

        bp::object walk = ast.attr("walk")(tree);
        for (bp::stl_input_iterator<bp::object> it(walk), end; it != end; ++it) {
            bp::object node = *it;
            string type = bp::extract<string>(node.attr("__class__").attr("__name__"));
            if (type == "FunctionDef") {
                ++facts.functions_defined;
            } else if (type == "ClassDef") {
                ++facts.classes_defined;
            } else if (type == "For" || type == "While") {
                ++facts.loops_used;
                ++facts.complexity_score;
            } else if (type == "If") {
                ++facts.conditionals_used;
                ++facts.complexity_score;
            } else if (type == "Assign") {
                ++facts.variables_assigned;
            } else if (type == "Import" || type == "ImportFrom") {
                ++facts.imports_used;
            } else if (type == "ExceptHandler") {
                ++facts.complexity_score;
            } else if (type == "BoolOp") {
                facts.complexity_score += (int)bp::len(node.attr("values")) - 1;
            }
        }
        return facts;
    } catch (bp::error_already_set &) {
        string message = fetch_python_error();
        LOG(ERROR) << "Unable to analyze code: " << message;
        throw analysis_error(message);
    }
}

}  // namespace tutor
