/**
 * Unit tests for PartScheduler
 */

#include <gtest/gtest.h>

#include <deque>
#include <functional>
#include <vector>

#include "part_scheduler.hpp"
#include "part_source.hpp"

using namespace ferry::engine;

namespace {

std::vector<ByteRange> ranges(size_t count) {
  std::vector<ByteRange> out;
  for (size_t i = 0; i < count; ++i) {
    out.push_back({i * 100, 100});
  }
  return out;
}

RequestOutcome ok() {
  RequestOutcome outcome;
  outcome.success = true;
  outcome.status = 200;
  outcome.attempts = 1;
  return outcome;
}

RequestOutcome failed(uint32_t part) {
  RequestOutcome outcome;
  outcome.status = 500;
  outcome.attempts = 4;
  outcome.error = ErrorInfo::make(ErrorKind::REMOTE_SERVICE, "boom", "InternalError", 500, part);
  return outcome;
}

class FailingSource : public IPartSource {
public:
  std::optional<Part> nextPart() override {
    throw FerryError(ErrorKind::PLANNING, "body vanished");
  }
  bool exhausted() const override { return false; }
};

}  // namespace

/**
 * Holds dispatched parts until the test completes them
 */
class PartSchedulerTest : public ::testing::Test {
protected:
  struct Pending {
    uint32_t part_number;
    std::function<void(RequestOutcome)> done;
  };

  std::unique_ptr<PartScheduler> makeScheduler(size_t max_concurrency, IPartSource& source) {
    return std::make_unique<PartScheduler>(
      max_concurrency, source,
      [this](Part& part, std::function<void(RequestOutcome)> done) {
        dispatched_.push_back(part.part_number);
        pending_.push_back({part.part_number, std::move(done)});
      },
      [this](PartResult& result) {
        if (result.outcome.success) {
          completed_.push_back(result.part.part_number);
        }
        return reject_part_ != result.part.part_number;
      },
      [this](std::optional<ErrorInfo> error) {
        ++drained_calls_;
        drained_error_ = error;
      }
    );
  }

  void completeFront(RequestOutcome outcome) {
    Pending pending = std::move(pending_.front());
    pending_.pop_front();
    pending.done(std::move(outcome));
  }

  void completeAll() {
    while (!pending_.empty()) {
      completeFront(ok());
    }
  }

  std::deque<Pending> pending_;
  std::vector<uint32_t> dispatched_;
  std::vector<uint32_t> completed_;
  int drained_calls_ = 0;
  std::optional<ErrorInfo> drained_error_;
  uint32_t reject_part_ = 0;
};

TEST_F(PartSchedulerTest, RespectsConcurrencyCap) {
  RangePartSource source(ranges(20));
  auto scheduler = makeScheduler(4, source);
  scheduler->start();

  EXPECT_EQ(scheduler->inFlight(), 4u);
  while (!pending_.empty()) {
    EXPECT_LE(scheduler->inFlight(), 4u);
    completeFront(ok());
  }

  EXPECT_EQ(scheduler->peakInFlight(), 4u);
  EXPECT_EQ(completed_.size(), 20u);
  EXPECT_EQ(drained_calls_, 1);
  EXPECT_FALSE(drained_error_.has_value());
}

TEST_F(PartSchedulerTest, AdmitsInPartNumberOrder) {
  RangePartSource source(ranges(10));
  auto scheduler = makeScheduler(3, source);
  scheduler->start();
  completeAll();

  ASSERT_EQ(dispatched_.size(), 10u);
  for (size_t i = 0; i < dispatched_.size(); ++i) {
    EXPECT_EQ(dispatched_[i], i + 1);
  }
}

TEST_F(PartSchedulerTest, FirstFailureStopsAdmissionAndDrains) {
  RangePartSource source(ranges(10));
  auto scheduler = makeScheduler(3, source);
  scheduler->start();

  completeFront(failed(1));
  EXPECT_TRUE(scheduler->stopped());
  EXPECT_EQ(drained_calls_, 0);  // parts 2 and 3 still in flight

  completeAll();
  EXPECT_EQ(drained_calls_, 1);
  ASSERT_TRUE(drained_error_.has_value());
  EXPECT_EQ(drained_error_->part_number, 1u);
  EXPECT_EQ(drained_error_->error_code, "InternalError");
  EXPECT_EQ(dispatched_.size(), 3u);
}

TEST_F(PartSchedulerTest, RejectedPartCountsAsFailure) {
  RangePartSource source(ranges(4));
  auto scheduler = makeScheduler(1, source);
  reject_part_ = 2;
  scheduler->start();
  completeAll();

  EXPECT_EQ(drained_calls_, 1);
  ASSERT_TRUE(drained_error_.has_value());
  EXPECT_EQ(drained_error_->part_number, 2u);
  EXPECT_EQ(dispatched_.size(), 2u);
}

TEST_F(PartSchedulerTest, StopReasonIsReportedWhenNothingFailed) {
  RangePartSource source(ranges(5));
  auto scheduler = makeScheduler(2, source);
  scheduler->start();

  scheduler->stop(ErrorInfo::make(ErrorKind::CANCELLED, "cancelled"));
  completeAll();

  ASSERT_TRUE(drained_error_.has_value());
  EXPECT_EQ(drained_error_->kind, ErrorKind::CANCELLED);
  EXPECT_EQ(dispatched_.size(), 2u);
}

TEST_F(PartSchedulerTest, AdmissionGateHoldsParts) {
  RangePartSource source(ranges(6));
  auto scheduler = makeScheduler(4, source);
  bool open = false;
  scheduler->setAdmissionGate([&open]() { return open; });
  scheduler->start();

  EXPECT_EQ(scheduler->inFlight(), 0u);
  EXPECT_EQ(drained_calls_, 0);

  open = true;
  scheduler->pump();
  EXPECT_EQ(scheduler->inFlight(), 4u);
  completeAll();
  EXPECT_EQ(completed_.size(), 6u);
  EXPECT_EQ(drained_calls_, 1);
}

TEST_F(PartSchedulerTest, RaisingConcurrencyAdmitsMore) {
  RangePartSource source(ranges(8));
  auto scheduler = makeScheduler(2, source);
  scheduler->start();
  EXPECT_EQ(scheduler->inFlight(), 2u);

  scheduler->setMaxConcurrency(5);
  EXPECT_EQ(scheduler->inFlight(), 5u);
  completeAll();
  EXPECT_EQ(scheduler->peakInFlight(), 5u);
}

TEST_F(PartSchedulerTest, SourceFailureIsReported) {
  FailingSource source;
  auto scheduler = makeScheduler(2, source);
  scheduler->start();

  EXPECT_EQ(drained_calls_, 1);
  ASSERT_TRUE(drained_error_.has_value());
  EXPECT_EQ(drained_error_->kind, ErrorKind::PLANNING);
}

TEST_F(PartSchedulerTest, SynchronousCompletionDoesNotRecurse) {
  RangePartSource source(ranges(50));
  size_t completed = 0;
  std::optional<ErrorInfo> error;
  bool drained = false;
  PartScheduler scheduler(
    3, source, [](Part&, std::function<void(RequestOutcome)> done) { done(ok()); },
    [&completed](PartResult&) {
      ++completed;
      return true;
    },
    [&](std::optional<ErrorInfo> e) {
      drained = true;
      error = e;
    }
  );
  scheduler.start();

  EXPECT_TRUE(drained);
  EXPECT_FALSE(error.has_value());
  EXPECT_EQ(completed, 50u);
}

TEST_F(PartSchedulerTest, StatusOfInFlightPart) {
  RangePartSource source(ranges(2));
  auto scheduler = makeScheduler(1, source);
  scheduler->start();

  EXPECT_EQ(scheduler->statusOf(1), PartStatus::IN_FLIGHT);
  EXPECT_FALSE(scheduler->statusOf(2).has_value());
  completeAll();
  EXPECT_FALSE(scheduler->statusOf(1).has_value());
}
