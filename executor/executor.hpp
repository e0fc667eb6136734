#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include "proto/evaluation.pb.h"

namespace executor {

class Executor {
 public:
  // Runs one job and returns its verdict. Implementations report every
  // failure through the verdict and must be safe to call from several
  // threads at once.
  virtual proto::Verdict Execute(const proto::Job& job) = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
