#ifndef FERRY_ENGINE_S3_CLIENT_HPP
#define FERRY_ENGINE_S3_CLIENT_HPP

#include <cstddef>
#include <memory>

#include "aws_api_guard.hpp"
#include "client_config.hpp"
#include "connection.hpp"
#include "file_interfaces.hpp"
#include "meta_request.hpp"
#include "planner.hpp"

namespace ferry {
namespace engine {

/**
 * Entry point of the meta-request engine.
 *
 * Owns no threads: every meta-request runs on its own strand of the
 * connection provider's executor, and all of them share the provider's
 * connection pool.
 */
class S3Client {
public:
  /**
   * @throws PlanningError if the configuration is unusable (e.g. part_size 0)
   */
  S3Client(
    const ClientConfig& config, std::shared_ptr<IConnectionProvider> provider,
    std::shared_ptr<ISigner> signer = nullptr
  );

  /**
   * Constructor with injectable file access (for testing)
   */
  S3Client(
    const ClientConfig& config, std::shared_ptr<IConnectionProvider> provider,
    std::shared_ptr<ISigner> signer, std::shared_ptr<IFileSystem> filesystem,
    std::shared_ptr<IFileStreamFactory> stream_factory
  );

  ~S3Client();

  S3Client(const S3Client&) = delete;
  S3Client& operator=(const S3Client&) = delete;

  /**
   * Validate and plan the descriptor, then start it.
   *
   * @throws PlanningError for malformed descriptors (nothing is sent)
   * @throws ResumeStateError if the resume token does not fit the request
   */
  std::shared_ptr<MetaRequest> makeMetaRequest(MetaRequestOptions options);

  const ClientConfig& config() const { return config_; }

  /**
   * Part window used when max_concurrency is not configured
   */
  size_t defaultConcurrency() const;

private:
  void checkResumeToken(
    const MetaRequestOptions& options, const Endpoint& endpoint, const PlanResult& plan
  ) const;

  AwsApiGuard sdk_;
  ClientConfig config_;
  std::shared_ptr<const MetaRequestPlanner> planner_;
  std::shared_ptr<IConnectionProvider> provider_;
  std::shared_ptr<ISigner> signer_;
  std::shared_ptr<IFileSystem> filesystem_;
  std::shared_ptr<IFileStreamFactory> stream_factory_;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_S3_CLIENT_HPP
