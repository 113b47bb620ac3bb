#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>
#include <string>

/**
 * 这个头文件包含嵌入式 CPython 解释器的帮助类
 * 降级执行器直接在宿主进程内通过 Python C API 运行选手代码，
 * 所有调用 Python C API 的线程都必须持有 GIL。
 */
namespace grader {

/**
 * @brief 在作用域内持有 GIL，可以在任意线程中使用
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

    GIL_guard(const GIL_guard &) = delete;
    GIL_guard &operator=(const GIL_guard &) = delete;

private:
    PyGILState_STATE state;
};

/**
 * @brief 在作用域内释放当前线程持有的 GIL
 * 用于在持有 GIL 时执行可能阻塞的操作（比如 join 另一个需要 GIL 的线程）
 */
class PyThread_guard {
public:
    PyThread_guard();
    ~PyThread_guard();

    PyThread_guard(const PyThread_guard &) = delete;
    PyThread_guard &operator=(const PyThread_guard &) = delete;

private:
    PyThreadState *state;
};

/**
 * @brief PyObject 的强引用
 * 构造时接管引用计数（new reference），析构时释放
 */
class py_ref {
public:
    py_ref() = default;
    explicit py_ref(PyObject *obj);
    py_ref(const py_ref &other);
    py_ref(py_ref &&other) noexcept;
    ~py_ref();

    py_ref &operator=(py_ref other) noexcept;

    /**
     * @brief 从借用引用（borrowed reference）构造，会增加引用计数
     */
    static py_ref borrow(PyObject *obj);

    PyObject *get() const;

    explicit operator bool() const;

private:
    PyObject *obj = nullptr;
};

/**
 * @brief 从 Python 异常中提取出的信息
 */
struct python_error {
    /**
     * @brief 异常类型名，比如 SyntaxError
     */
    std::string type;

    /**
     * @brief str(exception)
     */
    std::string message;

    /**
     * @brief traceback.format_exception 的结果
     */
    std::string traceback;
};

/**
 * @brief 取出并清除当前线程的 Python 异常
 * 调用方必须持有 GIL
 */
python_error fetch_python_error();

/**
 * @brief 将 Python str 对象转换为 UTF-8 字符串，失败时返回空串并清除异常
 */
std::string to_utf8(PyObject *unicode);

/**
 * @brief 嵌入式 Python 解释器的生命周期
 * 构造时初始化解释器并释放 GIL，析构时重新获取 GIL 并关闭解释器。
 * 整个进程只能存在一个实例，一般在 main 函数中创建。
 *
 * 解释器不安装信号处理函数，SIGINT 仍然由评测服务自己处理；
 * 宿主进程的 stdout 用于输出评测结果，因此 Python 的 sys.stdout 会被指向 sys.stderr。
 */
class python_interpreter {
public:
    python_interpreter();
    ~python_interpreter();

    python_interpreter(const python_interpreter &) = delete;
    python_interpreter &operator=(const python_interpreter &) = delete;

private:
    PyThreadState *state;
};

}  // namespace grader
