#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "execbox/executors/python_runtime.hpp"

#include "execbox/observability/global.hpp"

namespace execbox::executors {

namespace {

constexpr const char *SINK_CAPSULE = "execbox.output_sink";

bool keyword_string(PyObject *kwargs, const char *name, std::string &out) {
  if (kwargs == nullptr) {
    return true;
  }
  PyObject *value = PyDict_GetItemString(kwargs, name);
  if (value == nullptr || value == Py_None) {
    return true;
  }
  if (!PyUnicode_Check(value)) {
    PyErr_Format(PyExc_TypeError, "%s must be None or a string", name);
    return false;
  }
  const char *utf8 = PyUnicode_AsUTF8(value);
  if (utf8 == nullptr) {
    return false;
  }
  out = utf8;
  return true;
}

PyObject *capture_print(PyObject *self, PyObject *args, PyObject *kwargs) {
  auto *sink = static_cast<common::BoundedBuffer *>(PyCapsule_GetPointer(self, SINK_CAPSULE));
  if (sink == nullptr) {
    return nullptr;
  }

  std::string sep = " ";
  std::string end = "\n";
  if (!keyword_string(kwargs, "sep", sep) || !keyword_string(kwargs, "end", end)) {
    return nullptr;
  }

  std::string line;
  const Py_ssize_t count = PyTuple_Size(args);
  for (Py_ssize_t i = 0; i < count; ++i) {
    PyObject *text = PyObject_Str(PyTuple_GetItem(args, i));
    if (text == nullptr) {
      return nullptr;
    }
    const char *utf8 = PyUnicode_AsUTF8(text);
    if (utf8 == nullptr) {
      Py_DECREF(text);
      return nullptr;
    }
    if (i > 0) {
      line += sep;
    }
    line += utf8;
    Py_DECREF(text);
  }
  line += end;
  sink->append(line);
  Py_RETURN_NONE;
}

PyMethodDef PRINT_METHOD = {
    "print",
    reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)()>(capture_print)),
    METH_VARARGS | METH_KEYWORDS,
    "print(*values, sep=' ', end='\\n') writes to the captured output",
};

std::string object_text(PyObject *object) {
  if (object == nullptr) {
    return "";
  }
  PyObject *text = PyObject_Str(object);
  if (text == nullptr) {
    PyErr_Clear();
    return "";
  }
  const char *utf8 = PyUnicode_AsUTF8(text);
  std::string out = utf8 != nullptr ? utf8 : "";
  if (utf8 == nullptr) {
    PyErr_Clear();
  }
  Py_DECREF(text);
  return out;
}

// Caller holds the GIL and an exception is set.
std::string describe_pending_exception() {
  PyObject *type = nullptr;
  PyObject *value = nullptr;
  PyObject *traceback = nullptr;
  PyErr_Fetch(&type, &value, &traceback);
  PyErr_NormalizeException(&type, &value, &traceback);

  std::string type_name = "Exception";
  if (type != nullptr && PyType_Check(type)) {
    type_name = reinterpret_cast<PyTypeObject *>(type)->tp_name;
  }
  const std::string message = object_text(value);

  Py_XDECREF(type);
  Py_XDECREF(value);
  Py_XDECREF(traceback);

  return message.empty() ? "Execution error: " + type_name
                         : "Execution error: " + type_name + ": " + message;
}

// New reference to a globals dict exposing only the restricted builtins, or nullptr.
PyObject *build_restricted_globals(common::BoundedBuffer &out) {
  PyObject *builtins_module = PyImport_ImportModule("builtins");
  if (builtins_module == nullptr) {
    return nullptr;
  }
  PyObject *all_builtins = PyModule_GetDict(builtins_module);

  PyObject *safe = PyDict_New();
  PyObject *globals = PyDict_New();
  PyObject *capsule = PyCapsule_New(&out, SINK_CAPSULE, nullptr);
  PyObject *print = capsule != nullptr ? PyCFunction_New(&PRINT_METHOD, capsule) : nullptr;
  PyObject *module_name = PyUnicode_FromString("__main__");

  bool ok = safe != nullptr && globals != nullptr && print != nullptr && module_name != nullptr;
  if (ok) {
    for (const auto &name : restricted_builtin_names()) {
      if (name == "print") {
        continue;
      }
      if (PyObject *item = PyDict_GetItemString(all_builtins, name.c_str()); item != nullptr) {
        ok = ok && PyDict_SetItemString(safe, name.c_str(), item) == 0;
      }
    }
    // Needed for `class` statements.
    if (PyObject *build_class = PyDict_GetItemString(all_builtins, "__build_class__")) {
      ok = ok && PyDict_SetItemString(safe, "__build_class__", build_class) == 0;
    }
    ok = ok && PyDict_SetItemString(safe, "print", print) == 0;
    ok = ok && PyDict_SetItemString(globals, "__builtins__", safe) == 0;
    ok = ok && PyDict_SetItemString(globals, "__name__", module_name) == 0;
  }

  Py_XDECREF(module_name);
  Py_XDECREF(print);
  Py_XDECREF(capsule);
  Py_XDECREF(safe);
  Py_DECREF(builtins_module);
  if (!ok) {
    Py_XDECREF(globals);
    return nullptr;
  }
  return globals;
}

} // namespace

const std::vector<std::string> &restricted_builtin_names() {
  static const std::vector<std::string> names = {
      "print",     "len",        "range",          "str",          "int",
      "float",     "bool",       "list",           "dict",         "tuple",
      "set",       "frozenset",  "abs",            "min",          "max",
      "sum",       "round",      "sorted",         "reversed",     "enumerate",
      "zip",       "map",        "filter",         "any",          "all",
      "divmod",    "pow",        "isinstance",     "repr",         "chr",
      "ord",       "True",       "False",          "None",         "Exception",
      "ValueError", "TypeError", "KeyError",       "IndexError",   "ZeroDivisionError",
      "ArithmeticError", "RuntimeError", "StopIteration",
  };
  return names;
}

EmbeddedPython &EmbeddedPython::instance() {
  static EmbeddedPython runtime;
  return runtime;
}

EmbeddedPython::EmbeddedPython() {
  if (Py_IsInitialized() != 0) {
    // Host already embeds Python; share its interpreter.
    available_ = true;
    version_ = Py_GetVersion();
    return;
  }

  PyConfig config;
  PyConfig_InitIsolatedConfig(&config);
  config.install_signal_handlers = 0;
  config.site_import = 0;
  config.write_bytecode = 0;

  PyStatus status = PyConfig_SetBytesString(&config, &config.program_name, "python3");
  if (!PyStatus_Exception(status)) {
    status = Py_InitializeFromConfig(&config);
  }
  PyConfig_Clear(&config);

  if (PyStatus_Exception(status)) {
    init_error_ = status.err_msg != nullptr ? status.err_msg : "Python initialization failed";
    observability::record_runtime_check("python", false, init_error_);
    return;
  }

  available_ = true;
  version_ = Py_GetVersion();
  // Release the GIL taken by initialization; every run re-acquires it.
  (void)PyEval_SaveThread();
  observability::record_runtime_check("python", true, version_.substr(0, version_.find(' ')));
}

void EmbeddedPython::run(const std::string &code, common::BoundedBuffer &out,
                         common::BoundedBuffer &err, std::atomic<unsigned long> *thread_id) {
  if (!available_) {
    err.append("Execution error: Python runtime unavailable: " + init_error_);
    return;
  }

  const PyGILState_STATE gil = PyGILState_Ensure();
  if (thread_id != nullptr) {
    thread_id->store(PyThread_get_thread_ident());
  }

  PyObject *globals = build_restricted_globals(out);
  if (globals == nullptr) {
    err.append(PyErr_Occurred() != nullptr ? describe_pending_exception()
                                           : "Execution error: failed to build namespace");
    if (thread_id != nullptr) {
      thread_id->store(0);
    }
    PyGILState_Release(gil);
    return;
  }

  PyObject *result = PyRun_String(code.c_str(), Py_file_input, globals, globals);
  if (result == nullptr) {
    err.append(describe_pending_exception());
  } else {
    Py_DECREF(result);
  }
  Py_DECREF(globals);
  if (thread_id != nullptr) {
    thread_id->store(0);
  }
  PyGILState_Release(gil);
}

bool EmbeddedPython::interrupt(const std::atomic<unsigned long> &thread_id) {
  if (!available_) {
    return false;
  }
  const PyGILState_STATE gil = PyGILState_Ensure();
  // Read under the GIL: `run` clears the id before it lets go of the interpreter.
  const unsigned long target = thread_id.load();
  const int delivered = target != 0 ? PyThreadState_SetAsyncExc(target, PyExc_TimeoutError) : 0;
  PyGILState_Release(gil);
  return delivered == 1;
}

} // namespace execbox::executors
