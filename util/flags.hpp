#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Executor flags
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);
DECLARE_string(interpreter);
DECLARE_string(interpreter_args);
DECLARE_string(program_name);
DECLARE_bool(completion_check);

// Resource limits
DECLARE_int64(memory_limit_kb);
DECLARE_int64(max_file_size_kb);
DECLARE_int32(max_files);
DECLARE_int64(max_stack_kb);

// Orchestrator flags
DECLARE_int32(num_workers);

#endif
