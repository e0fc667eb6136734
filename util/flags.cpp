#include "util/flags.hpp"

DEFINE_string(temp_directory, "temp", "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove the sandbox directories after the execution");
DEFINE_string(interpreter, "python3",
              "Interpreter used to run the programs. Looked up in PATH if "
              "not absolute");
DEFINE_string(interpreter_args, "-B",
              "Space separated arguments passed to the interpreter before the "
              "program file");
DEFINE_string(program_name, "program.py",
              "Name of the file the program text is written to");
DEFINE_bool(completion_check, true,
            "Run programs through a bootstrap that disables the exit "
            "functions and records whether the program ran to its end. "
            "Requires a Python interpreter");

DEFINE_int64(memory_limit_kb, 4 * 1024 * 1024,
             "Address space limit of every execution. 0 means unlimited");
DEFINE_int64(max_file_size_kb, 64 * 1024,
             "Maximum size of a file written by the program. 0 means "
             "unlimited");
DEFINE_int32(max_files, 256, "Maximum number of open files. 0 means unlimited");
DEFINE_int64(max_stack_kb, 0, "Stack limit. 0 means unlimited");

DEFINE_int32(
    num_workers, 0,
    "Number of concurrent executions. If unset, autodetect");
