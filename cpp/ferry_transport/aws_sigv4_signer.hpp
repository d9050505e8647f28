#ifndef FERRY_TRANSPORT_AWS_SIGV4_SIGNER_HPP
#define FERRY_TRANSPORT_AWS_SIGV4_SIGNER_HPP

#include <memory>
#include <string>

#include <aws_api_guard.hpp>
#include <connection.hpp>
#include <ferry_config.hpp>

namespace ferry {
namespace transport {

/**
 * AWS Signature Version 4 signer backed by the AWS SDK.
 *
 * Credentials are taken from SigningConfig when both keys are set, then from
 * AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY / AWS_SESSION_TOKEN, and finally
 * from the SDK default provider chain. Payloads are sent as UNSIGNED-PAYLOAD
 * unless sign_payload is enabled. Requests already marked
 * STREAMING-UNSIGNED-PAYLOAD-TRAILER (aws-chunked with a checksum trailer)
 * keep that payload hash.
 */
class AwsSigV4Signer : public engine::ISigner {
public:
  explicit AwsSigV4Signer(const engine::SigningConfig& config);
  ~AwsSigV4Signer() override;

  AwsSigV4Signer(const AwsSigV4Signer&) = delete;
  AwsSigV4Signer& operator=(const AwsSigV4Signer&) = delete;

  /**
   * Sign in place. The request must already carry its Host header.
   */
  bool sign(engine::HttpRequest& request, const std::string* payload) override;

  const engine::SigningConfig& config() const { return config_; }

private:
  struct Impl;

  engine::SigningConfig config_;
  engine::AwsApiGuard api_guard_;  // must outlive impl_
  std::unique_ptr<Impl> impl_;
};

/**
 * Percent-decode a URI path ("%20" -> " "). Malformed escapes are kept as-is.
 */
std::string uriDecode(const std::string& value);

}  // namespace transport
}  // namespace ferry

#endif  // FERRY_TRANSPORT_AWS_SIGV4_SIGNER_HPP
