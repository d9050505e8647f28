#ifndef FERRY_ENGINE_FILE_INTERFACES_IMPL_HPP
#define FERRY_ENGINE_FILE_INTERFACES_IMPL_HPP

#include <filesystem>
#include <fstream>
#include <memory>
#include <system_error>

#include "file_interfaces.hpp"

namespace ferry {
namespace engine {

/**
 * IFileSystem over std::filesystem
 */
class FileSystemImpl : public IFileSystem {
public:
  bool exists(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
  }

  uint64_t file_size(const std::string& path) const override {
    return static_cast<uint64_t>(std::filesystem::file_size(path));
  }
};

/**
 * IFileStream over std::ifstream
 */
class FileStreamImpl : public IFileStream {
public:
  FileStreamImpl(const std::string& path, std::ios_base::openmode mode)
      : stream_(path, mode) {}

  IFileStream& read(char* buffer, std::streamsize size) override {
    stream_.read(buffer, size);
    return *this;
  }

  IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) override {
    stream_.clear();
    stream_.seekg(offset, origin);
    return *this;
  }

  std::streamsize gcount() const override { return stream_.gcount(); }

  bool eof() const override { return stream_.eof(); }

  bool bad() const override { return stream_.bad(); }

  bool is_open() const { return stream_.is_open(); }

private:
  std::ifstream stream_;
};

class FileStreamFactoryImpl : public IFileStreamFactory {
public:
  std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) override {
    auto stream = std::make_unique<FileStreamImpl>(path, mode);
    if (!stream->is_open()) {
      return nullptr;
    }
    return stream;
  }
};

}  // namespace engine
}  // namespace ferry

#endif  // FERRY_ENGINE_FILE_INTERFACES_IMPL_HPP
