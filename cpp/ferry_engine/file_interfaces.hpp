#ifndef FERRY_ENGINE_FILE_INTERFACES_HPP
#define FERRY_ENGINE_FILE_INTERFACES_HPP

#include <cstdint>
#include <ios>
#include <memory>
#include <string>

namespace ferry {
namespace engine {

/**
 * Interface for filesystem queries
 * Allows mocking filesystem operations for testing
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  virtual bool exists(const std::string& path) const = 0;

  /**
   * Size of a regular file in bytes
   */
  virtual uint64_t file_size(const std::string& path) const = 0;
};

/**
 * Interface for reading a file
 */
class IFileStream {
public:
  virtual ~IFileStream() = default;

  virtual IFileStream& read(char* buffer, std::streamsize size) = 0;

  virtual IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) = 0;

  /**
   * Number of characters read by the last read()
   */
  virtual std::streamsize gcount() const = 0;

  virtual bool eof() const = 0;

  virtual bool bad() const = 0;
};

/**
 * Factory for file streams
 */
class IFileStreamFactory {
public:
  virtual ~IFileStreamFactory() = default;

  /**
   * @return the opened stream, or nullptr if the file cannot be opened
   */
  virtual std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) = 0;
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_FILE_INTERFACES_HPP
