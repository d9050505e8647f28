#include "aws_api_guard.hpp"

#include <aws/core/Aws.h>
#include <aws/core/utils/logging/LogLevel.h>

#include <mutex>

namespace ferry {
namespace engine {

namespace {

class AwsSdkLifetime {
public:
  static AwsSdkLifetime& instance() {
    static AwsSdkLifetime instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      options_.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options_);
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ == 0) {
      return;
    }
    if (--ref_count_ == 0 && initialized_) {
      Aws::ShutdownAPI(options_);
      initialized_ = false;
    }
  }

  int references() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ref_count_;
  }

private:
  AwsSdkLifetime() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

}  // namespace

AwsApiGuard::AwsApiGuard() {
  AwsSdkLifetime::instance().addRef();
}

AwsApiGuard::AwsApiGuard(const AwsApiGuard&) {
  AwsSdkLifetime::instance().addRef();
}

AwsApiGuard::~AwsApiGuard() {
  AwsSdkLifetime::instance().release();
}

int AwsApiGuard::activeReferences() {
  return AwsSdkLifetime::instance().references();
}

}  // namespace engine
}  // namespace ferry
