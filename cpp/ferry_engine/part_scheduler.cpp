#include "part_scheduler.hpp"

#include <algorithm>

#define FERRY_LOG_COMPONENT "part_scheduler"
#include <ferry_log_macros.hpp>

namespace ferry {
namespace engine {

using logging::kv;

PartScheduler::PartScheduler(
  size_t max_concurrency, IPartSource& source, Dispatch dispatch, PartCompleted on_part,
  Drained on_drained
)
    : max_concurrency_(std::max<size_t>(1, max_concurrency))
    , source_(source)
    , dispatch_(std::move(dispatch))
    , on_part_(std::move(on_part))
    , on_drained_(std::move(on_drained)) {}

void PartScheduler::start() {
  if (started_) {
    return;
  }
  started_ = true;
  pump();
}

void PartScheduler::stop(const ErrorInfo& reason) {
  if (!first_error_) {
    first_error_ = reason;
  }
  stopped_ = true;
  maybeDrained();
}

void PartScheduler::setMaxConcurrency(size_t max_concurrency) {
  max_concurrency_ = std::max<size_t>(1, max_concurrency);
  pump();
}

std::optional<PartStatus> PartScheduler::statusOf(uint32_t part_number) const {
  auto it = in_flight_.find(part_number);
  if (it == in_flight_.end()) {
    return std::nullopt;
  }
  return it->second.status;
}

void PartScheduler::pump() {
  // Dispatch may complete synchronously; the flag keeps admission iterative
  if (!started_ || pumping_ || drained_) {
    return;
  }
  pumping_ = true;

  while (!stopped_ && in_flight_.size() < max_concurrency_ && (!gate_ || gate_())) {
    std::optional<Part> next;
    try {
      next = source_.nextPart();
    } catch (const FerryError& e) {
      FERRY_LOG_ERROR("Failed to produce next part" << kv("error", e.what()));
      if (!first_error_) {
        first_error_ = ErrorInfo::make(e.kind(), e.what());
      }
      stopped_ = true;
      break;
    }
    if (!next) {
      break;
    }

    uint32_t number = next->part_number;
    next->status = PartStatus::IN_FLIGHT;
    auto inserted = in_flight_.emplace(number, std::move(*next));
    Part& part = inserted.first->second;
    ++admitted_;
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_.size());

    FERRY_LOG_DEBUG(
      "Dispatching part" << kv("part", number) << kv("in_flight", in_flight_.size())
    );
    dispatch_(part, [this, number](RequestOutcome outcome) {
      onPartDone(number, std::move(outcome));
    });
  }

  pumping_ = false;
  maybeDrained();
}

void PartScheduler::onPartDone(uint32_t part_number, RequestOutcome outcome) {
  auto it = in_flight_.find(part_number);
  if (it == in_flight_.end()) {
    return;
  }

  PartResult result{std::move(it->second), std::move(outcome)};
  in_flight_.erase(it);
  result.part.attempts = result.outcome.attempts;

  bool ok = result.outcome.success;
  if (ok && on_part_) {
    result.part.status = PartStatus::SUCCEEDED;
    ok = on_part_(result);
  } else if (!ok && on_part_) {
    result.part.status = PartStatus::FAILED;
    on_part_(result);
  }

  if (!ok) {
    result.part.status = PartStatus::FAILED;
    if (!first_error_) {
      ErrorInfo error = result.outcome.error;
      if (error.part_number == 0) {
        error.part_number = part_number;
      }
      first_error_ = error;
      FERRY_LOG_ERROR("Part failed, draining" << kv("part", part_number)
                                              << kv("error", error.describe()));
    }
    stopped_ = true;
  }

  pump();
}

void PartScheduler::maybeDrained() {
  if (drained_ || !started_ || pumping_ || !in_flight_.empty()) {
    return;
  }
  if (!stopped_ && !source_.exhausted()) {
    // Waiting on the admission gate
    return;
  }
  drained_ = true;
  if (on_drained_) {
    on_drained_(first_error_);
  }
}

}  // namespace engine
}  // namespace ferry
