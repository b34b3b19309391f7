/**
 * @file processor.hpp
 * @brief Unit-of-work contract executed by stage workers.
 */

#ifndef SLUICE_PROCESSOR_HPP_
#define SLUICE_PROCESSOR_HPP_

#include "sluice/context.hpp"
#include "sluice/failure.hpp"
#include "sluice/vocabulary.hpp"

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace sluice {

/// Anything copyable can flow through a pipeline.
using Value = std::any;

using Result = expected<Value, Failure>;

inline Result Ok(Value value) { return Result::success(std::move(value)); }

inline Result Fail(Failure failure) { return Result::error(std::move(failure)); }

inline Result Fail(std::string message) {
  return Result::error(Failure(FailureKind::kReported, std::move(message)));
}

/**
 * @brief Work executed for each payload.
 *
 * Invoked concurrently from every worker of the owning stage. @p incoming is
 * set (and @p value empty) when the payload arrived through Stage::Error.
 * Returning a failure routes it to the subscribers' Error path. Exceptions
 * are caught by the stage and reported as FailureKind::kFault.
 */
class Processor {
 public:
  virtual ~Processor() = default;
  virtual Result Do(const Context& ctx, const Failure& incoming, const Value& value) = 0;
};

using ProcessorFn = std::function<Result(const Context&, const Failure&, const Value&)>;

/**
 * @brief Adapts a plain callable into a Processor.
 */
class FunctionProcessor final : public Processor {
 public:
  explicit FunctionProcessor(ProcessorFn fn) : fn_(std::move(fn)) {}

  Result Do(const Context& ctx, const Failure& incoming, const Value& value) override {
    return fn_(ctx, incoming, value);
  }

 private:
  ProcessorFn fn_;
};

/// nullptr when @p fn is empty.
inline std::shared_ptr<Processor> MakeProcessor(ProcessorFn fn) {
  if (!fn) return nullptr;
  return std::make_shared<FunctionProcessor>(std::move(fn));
}

}  // namespace sluice

#endif  // SLUICE_PROCESSOR_HPP_
