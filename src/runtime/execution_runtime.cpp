#include "runtime/execution_runtime.hpp"

#include <algorithm>

#include <boost/thread/thread.hpp>

OUTCOME_CPP_DEFINE_CATEGORY_3(wasmbridge::runtime, ExecutionRuntime::Error, e) {
  using E = wasmbridge::runtime::ExecutionRuntime::Error;
  switch (e) {
    case E::THREAD_START_FAILED:
      return "execution thread could not be started";
    case E::TASK_NOT_COMPLETED:
      return "execution task did not complete";
  }
  return "unknown error";
}

namespace wasmbridge::runtime {

  ExecutionRuntime::ExecutionRuntime(size_t stack_size)
      : stack_size_{std::max(stack_size, kMinStackSize)} {}

  outcome::result<void> ExecutionRuntime::drive() {
    std::exception_ptr failure;
    auto run = [this, &failure] {
      // keep draining after a throwing handler so that no work is left
      for (;;) {
        try {
          io_context_.run();
          break;
        } catch (...) {
          if (!failure) {
            failure = std::current_exception();
          }
        }
      }
    };

    boost::thread::attributes attributes;
    attributes.set_stack_size(stack_size_);

    io_context_.restart();
    try {
      boost::thread worker(attributes, run);
      worker.join();
    } catch (const boost::thread_resource_error &e) {
      logger_->error("Cannot start execution thread: {}", e.what());
      return Error::THREAD_START_FAILED;
    }

    if (failure) {
      std::rethrow_exception(failure);
    }
    return outcome::success();
  }

}  // namespace wasmbridge::runtime
