#ifndef FERRY_ENGINE_BODY_SOURCE_HPP
#define FERRY_ENGINE_BODY_SOURCE_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "file_interfaces.hpp"

namespace ferry {
namespace engine {

/**
 * Sequential reader over the caller's request body.
 * Parts are read strictly in ascending order, so no random access is needed.
 */
class IBodySource {
public:
  virtual ~IBodySource() = default;

  /**
   * Remaining size in bytes, or nullopt for streams of unknown length
   */
  virtual std::optional<uint64_t> size() const = 0;

  /**
   * Append up to `max_bytes` to `out`. Returns fewer only at end of body.
   * @throws FerryError on an I/O failure
   */
  virtual size_t read(std::string& out, size_t max_bytes) = 0;

  /**
   * Discard up to `bytes` bytes; returns how many were skipped
   */
  virtual uint64_t skip(uint64_t bytes) = 0;

  virtual bool atEnd() const = 0;

  virtual std::string describe() const = 0;
};

/**
 * Body read from a local file through the file stream factory
 */
class FileBodySource : public IBodySource {
public:
  /**
   * @throws PlanningError if the file does not exist or cannot be opened
   */
  FileBodySource(const std::string& path, IFileSystem& fs, IFileStreamFactory& factory);

  std::optional<uint64_t> size() const override { return size_ - position_; }
  size_t read(std::string& out, size_t max_bytes) override;
  uint64_t skip(uint64_t bytes) override;
  bool atEnd() const override { return position_ >= size_; }
  std::string describe() const override { return "file:" + path_; }

private:
  std::string path_;
  uint64_t size_ = 0;
  uint64_t position_ = 0;
  std::unique_ptr<IFileStream> stream_;
};

/**
 * Body read from a caller-supplied std::istream.
 * Seekable streams report their remaining length; others report none.
 */
class StreamBodySource : public IBodySource {
public:
  explicit StreamBodySource(std::shared_ptr<std::istream> stream);

  std::optional<uint64_t> size() const override;
  size_t read(std::string& out, size_t max_bytes) override;
  uint64_t skip(uint64_t bytes) override;
  bool atEnd() const override;
  std::string describe() const override { return "stream"; }

private:
  std::shared_ptr<std::istream> stream_;
  std::optional<uint64_t> total_;
  uint64_t consumed_ = 0;
  bool ended_ = false;
};

/**
 * Pick the body for a request: the file path wins over the stream when both
 * are given. Returns nullptr when neither is set.
 */
std::unique_ptr<IBodySource> makeBodySource(
  const std::string& file_path, const std::shared_ptr<std::istream>& stream, IFileSystem& fs,
  IFileStreamFactory& factory
);

/**
 * Read the entire remaining body into memory
 */
std::string readAll(IBodySource& source);

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_BODY_SOURCE_HPP
