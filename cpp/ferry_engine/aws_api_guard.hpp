#ifndef FERRY_ENGINE_AWS_API_GUARD_HPP
#define FERRY_ENGINE_AWS_API_GUARD_HPP

namespace ferry {
namespace engine {

/**
 * Scoped reference on the AWS SDK runtime.
 *
 * Aws::InitAPI / Aws::ShutdownAPI must run once per process; the first guard
 * initializes the SDK and the last one to go away shuts it down. Every object
 * that uses SDK crypto, credentials or XML utilities holds a guard that
 * outlives its SDK members.
 */
class AwsApiGuard {
public:
  AwsApiGuard();
  ~AwsApiGuard();

  AwsApiGuard(const AwsApiGuard&);
  AwsApiGuard& operator=(const AwsApiGuard&) = default;

  static int activeReferences();
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_AWS_API_GUARD_HPP
