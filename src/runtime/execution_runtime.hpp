#ifndef WASMBRIDGE_SRC_RUNTIME_EXECUTION_RUNTIME_HPP
#define WASMBRIDGE_SRC_RUNTIME_EXECUTION_RUNTIME_HPP

#include <exception>
#include <functional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/optional.hpp>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"

namespace wasmbridge::runtime {

  /**
   * @brief Single-threaded cooperative scheduler for one execution call.
   *
   * Everything posted to context() runs on one thread whose stack is at
   * least kMinStackSize bytes. blockOn() returns once the posted task has
   * finished and no other work (pending stream I/O included) is left.
   * An instance serves one caller at a time and is never shared between
   * concurrent execution calls.
   */
  class ExecutionRuntime {
   public:
    enum class Error { THREAD_START_FAILED = 1, TASK_NOT_COMPLETED };

    static constexpr size_t kMinStackSize = 8 * 1024 * 1024;

    /**
     * @param stack_size requested stack of the execution thread, raised to
     * kMinStackSize when smaller
     */
    explicit ExecutionRuntime(size_t stack_size = kMinStackSize);

    ExecutionRuntime(const ExecutionRuntime &) = delete;
    ExecutionRuntime &operator=(const ExecutionRuntime &) = delete;

    ~ExecutionRuntime() = default;

    boost::asio::io_context &context() {
      return io_context_;
    }

    size_t stackSize() const {
      return stack_size_;
    }

    /**
     * Runs \arg task on the execution thread and waits for it and for all
     * work it left behind. An exception escaping the task is rethrown here.
     */
    template <typename T>
    outcome::result<T> blockOn(std::function<outcome::result<T>()> task) {
      boost::optional<outcome::result<T>> result;
      boost::asio::post(io_context_,
                        [&result, &task] { result.emplace(task()); });
      OUTCOME_TRY(drive());
      if (!result) {
        return Error::TASK_NOT_COMPLETED;
      }
      return std::move(*result);
    }

   private:
    /**
     * Runs the io_context on a fresh thread until it is out of work
     */
    outcome::result<void> drive();

    size_t stack_size_;
    boost::asio::io_context io_context_;
    base::Logger logger_ = base::createLogger("ExecutionRuntime");
  };

}  // namespace wasmbridge::runtime

OUTCOME_HPP_DECLARE_ERROR_2(wasmbridge::runtime, ExecutionRuntime::Error);

#endif  // WASMBRIDGE_SRC_RUNTIME_EXECUTION_RUNTIME_HPP
