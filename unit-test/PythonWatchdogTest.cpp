#include <thread>
#include "common/python.hpp"
#include "grading/python_watchdog.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

TEST(PythonWatchdogTest, InterruptsGuardedCode) {
    GIL_guard gil;
    python_watchdog watchdog(chrono::milliseconds(100));
    py_ref globals(PyDict_New());
    PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins());
    {
        python_watchdog::guard guard(watchdog);
        py_ref result(PyRun_String("while True:\n    pass\n", Py_file_input, globals.get(), globals.get()));
        EXPECT_EQ(result.get(), nullptr);
        EXPECT_TRUE(PyErr_ExceptionMatches(PyExc_TimeoutError));
        PyErr_Clear();
    }
    watchdog.disarm();
    EXPECT_TRUE(watchdog.expired());
    EXPECT_TRUE(watchdog.overdue());
}

TEST(PythonWatchdogTest, DeadlineAfterGuardedCodeIsNotExpiry) {
    // 数据点全部完成后才到期，不能把已经完成的评测判为超时
    GIL_guard gil;
    python_watchdog watchdog(chrono::milliseconds(50));
    py_ref globals(PyDict_New());
    PyDict_SetItemString(globals.get(), "__builtins__", PyEval_GetBuiltins());
    {
        python_watchdog::guard guard(watchdog);
        py_ref result(PyRun_String("1 + 1", Py_eval_input, globals.get(), globals.get()));
        EXPECT_NE(result.get(), nullptr);
    }
    {
        PyThread_guard release;
        this_thread::sleep_for(chrono::milliseconds(300));
    }
    watchdog.disarm();
    EXPECT_FALSE(watchdog.expired());
    EXPECT_TRUE(watchdog.overdue());
    EXPECT_FALSE(PyErr_Occurred());
}

TEST(PythonWatchdogTest, DisarmBeforeDeadline) {
    GIL_guard gil;
    python_watchdog watchdog(chrono::milliseconds(5000));
    watchdog.disarm();
    watchdog.disarm();
    EXPECT_FALSE(watchdog.expired());
    EXPECT_FALSE(watchdog.overdue());
}
