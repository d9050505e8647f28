#ifndef FERRY_ENGINE_PART_SCHEDULER_HPP
#define FERRY_ENGINE_PART_SCHEDULER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

#include "engine_errors.hpp"
#include "part.hpp"
#include "request_executor.hpp"

namespace ferry {
namespace engine {

/**
 * Supplies parts in ascending part-number order
 */
class IPartSource {
public:
  virtual ~IPartSource() = default;

  /**
   * Next part to admit, or nullopt when none remain.
   * @throws FerryError if the part cannot be produced (e.g. body read failure)
   */
  virtual std::optional<Part> nextPart() = 0;

  virtual bool exhausted() const = 0;
};

/**
 * Outcome of one part, as reported to the owner
 */
struct PartResult {
  Part part;
  RequestOutcome outcome;
};

/**
 * Bounded-window executor for the parts of one meta-request.
 *
 * Parts are admitted in FIFO order while fewer than max_concurrency are in
 * flight. The first failed part stops admission; parts already in flight
 * drain before the drained callback fires. All calls happen on the owning
 * strand.
 */
class PartScheduler {
public:
  // Runs one part and reports its outcome exactly once
  using Dispatch = std::function<void(Part& part, std::function<void(RequestOutcome)> done)>;
  // Returns false to fail the part after a successful exchange (e.g. checksum mismatch)
  using PartCompleted = std::function<bool(PartResult& result)>;
  using Drained = std::function<void(std::optional<ErrorInfo> first_error)>;
  using AdmissionGate = std::function<bool()>;

  PartScheduler(
    size_t max_concurrency, IPartSource& source, Dispatch dispatch, PartCompleted on_part,
    Drained on_drained
  );

  void start();

  /**
   * Stop admitting parts; `reason` becomes the reported error unless a part
   * already failed
   */
  void stop(const ErrorInfo& reason);

  /**
   * Re-evaluate admission, e.g. after the gate opened
   */
  void pump();

  void setMaxConcurrency(size_t max_concurrency);
  void setAdmissionGate(AdmissionGate gate) { gate_ = std::move(gate); }

  size_t maxConcurrency() const { return max_concurrency_; }
  size_t inFlight() const { return in_flight_.size(); }
  size_t peakInFlight() const { return peak_in_flight_; }
  size_t admitted() const { return admitted_; }
  bool stopped() const { return stopped_; }
  bool drained() const { return drained_; }

  /**
   * Status of an in-flight part, nullopt if not in flight
   */
  std::optional<PartStatus> statusOf(uint32_t part_number) const;

private:
  void onPartDone(uint32_t part_number, RequestOutcome outcome);
  void maybeDrained();

  size_t max_concurrency_;
  IPartSource& source_;
  Dispatch dispatch_;
  PartCompleted on_part_;
  Drained on_drained_;
  AdmissionGate gate_;

  std::map<uint32_t, Part> in_flight_;
  size_t peak_in_flight_ = 0;
  size_t admitted_ = 0;
  bool started_ = false;
  bool stopped_ = false;
  bool drained_ = false;
  bool pumping_ = false;
  std::optional<ErrorInfo> first_error_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_PART_SCHEDULER_HPP
