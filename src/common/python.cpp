#include "common/python.hpp"
#include <glog/logging.h>

namespace tutor {

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

python_interpreter::python_interpreter(const char *program_name) : main_state(nullptr) {
    if (Py_IsInitialized()) return;

    wchar_t *progname = Py_DecodeLocale(program_name, NULL);
    if (progname) Py_SetProgramName(progname);
    // 不安装 Python 的信号处理函数，SIGINT 由我们自己处理
    Py_InitializeEx(0);
    LOG(INFO) << "Embedded Python " << Py_GetVersion() << " initialized";
    main_state = PyEval_SaveThread();
}

python_interpreter::~python_interpreter() {
    if (main_state) PyEval_RestoreThread(main_state);
}

}  // namespace tutor
